#pragma once

#include <tku/aggregate.hpp>
#include <tku/cost.hpp>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>

namespace tku {

// 999 -> "999", 1500 -> "1.5K", 2300000 -> "2.3M"
std::string format_tokens(uint64_t n);

// "$1.23"; "N/A" when the cost is undefined
std::string format_cost(const Cost& cost);

// Plain-text table: one row per bucket in key order, optional per-model
// rows under each bucket, then a TOTAL row.
void print_table(std::ostream& out,
                 const std::map<std::string, AggregatedBucket>& buckets,
                 Grouping grouping,
                 bool breakdown);

} // namespace tku
