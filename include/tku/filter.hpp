#pragma once

#include <tku/record.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tku {

// Post-dedup record selection. Unset fields match everything.
struct RecordFilter {
    std::optional<std::string> from;      // inclusive "YYYY-MM-DD" (UTC)
    std::optional<std::string> to;        // inclusive "YYYY-MM-DD" (UTC)
    std::optional<std::string> project;   // case-insensitive substring
    std::optional<std::string> tool;      // case-insensitive provider name

    // Rejects malformed dates and from > to
    Status validate() const;
    bool matches(const UsageRecord& r) const;
};

std::vector<UsageRecord> apply_filter(std::vector<UsageRecord> records,
                                      const RecordFilter& filter);

} // namespace tku
