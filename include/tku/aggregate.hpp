#pragma once

#include <tku/cost.hpp>
#include <tku/record.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace tku {

struct ModelBucketDetail {
    std::string model;
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t cache_creation_input_tokens = 0;
    uint64_t cache_read_input_tokens = 0;
    Cost cost;

    void accumulate(const UsageRecord& r, const Cost& record_cost);
};

struct AggregatedBucket {
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    uint64_t cache_creation_input_tokens = 0;
    uint64_t cache_read_input_tokens = 0;
    Cost cost;

    std::vector<std::string> models;     // short names, descending per-model cost
    std::vector<std::string> projects;   // distinct, sorted
    std::vector<std::string> tools;      // distinct provider names, sorted
    std::vector<ModelBucketDetail> details;

    void accumulate(uint64_t input, uint64_t output,
                    uint64_t cache_creation, uint64_t cache_read,
                    const Cost& c);
    void accumulate_from(const AggregatedBucket& other);
};

using BucketKeyFn = std::function<std::string(const UsageRecord&)>;

enum class Grouping { Daily, Monthly, Session, Model };

// "daily", "monthly", "session", "model"
bool parse_grouping(const std::string& name, Grouping& out);
const char* grouping_name(Grouping g);

// daily: "YYYY-MM-DD", monthly: "YYYY-MM", session: "project | session",
// model: model id
BucketKeyFn bucket_key_fn(Grouping g);

// Display form of a model id: "claude-sonnet-4-5-20250929" -> "sonnet-4-5".
// Never used for pricing lookups.
std::string short_model_name(const std::string& model);

// Group records by `key_fn`, pricing each one. Keys come back sorted.
std::map<std::string, AggregatedBucket> aggregate(
    const std::vector<UsageRecord>& records,
    const BucketKeyFn& key_fn,
    const PricingMap& pricing);

// Grand total across buckets (tokens and cost only)
AggregatedBucket total_of(const std::map<std::string, AggregatedBucket>& buckets);

} // namespace tku
