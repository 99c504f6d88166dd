#include <tku/aggregate.hpp>

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_map>

namespace tku {

void ModelBucketDetail::accumulate(const UsageRecord& r, const Cost& record_cost) {
    input_tokens += r.input_tokens;
    output_tokens += r.output_tokens;
    cache_creation_input_tokens += r.cache_creation_input_tokens;
    cache_read_input_tokens += r.cache_read_input_tokens;
    cost += record_cost;
}

void AggregatedBucket::accumulate(uint64_t input, uint64_t output,
                                  uint64_t cache_creation, uint64_t cache_read,
                                  const Cost& c) {
    input_tokens += input;
    output_tokens += output;
    cache_creation_input_tokens += cache_creation;
    cache_read_input_tokens += cache_read;
    cost += c;
}

void AggregatedBucket::accumulate_from(const AggregatedBucket& other) {
    accumulate(other.input_tokens, other.output_tokens,
               other.cache_creation_input_tokens, other.cache_read_input_tokens,
               other.cost);
}

// ---------------------------------------------------------------------------
// Bucket keys
// ---------------------------------------------------------------------------

bool parse_grouping(const std::string& name, Grouping& out) {
    if (name == "daily")   { out = Grouping::Daily;   return true; }
    if (name == "monthly") { out = Grouping::Monthly; return true; }
    if (name == "session") { out = Grouping::Session; return true; }
    if (name == "model")   { out = Grouping::Model;   return true; }
    return false;
}

const char* grouping_name(Grouping g) {
    switch (g) {
        case Grouping::Daily:   return "daily";
        case Grouping::Monthly: return "monthly";
        case Grouping::Session: return "session";
        case Grouping::Model:   return "model";
    }
    return "unknown";
}

BucketKeyFn bucket_key_fn(Grouping g) {
    switch (g) {
        case Grouping::Daily:
            return [](const UsageRecord& r) { return format_date(r.timestamp); };
        case Grouping::Monthly:
            return [](const UsageRecord& r) { return format_month(r.timestamp); };
        case Grouping::Session:
            return [](const UsageRecord& r) { return r.project + " | " + r.session_id; };
        case Grouping::Model:
            return [](const UsageRecord& r) { return r.model; };
    }
    return [](const UsageRecord& r) { return format_date(r.timestamp); };
}

std::string short_model_name(const std::string& model) {
    static const std::string vendor_prefix = "claude-";

    std::string s = model;
    if (s.compare(0, vendor_prefix.size(), vendor_prefix) == 0) {
        s = s.substr(vendor_prefix.size());
    }

    // Trailing "-YYYYMMDD"
    if (s.size() > 9 && s[s.size() - 9] == '-') {
        bool all_digits = std::all_of(s.end() - 8, s.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
        if (all_digits) s.resize(s.size() - 9);
    }
    return s;
}

// ---------------------------------------------------------------------------
// Aggregation
// ---------------------------------------------------------------------------

namespace {

// Everything accumulated for one key during the record loop
struct BucketState {
    AggregatedBucket bucket;
    std::set<std::string> projects;
    std::set<std::string> tools;
    std::map<std::string, ModelBucketDetail> model_details;
};

} // namespace

std::map<std::string, AggregatedBucket> aggregate(
    const std::vector<UsageRecord>& records,
    const BucketKeyFn& key_fn,
    const PricingMap& pricing)
{
    std::unordered_map<std::string, BucketState> states;

    for (const auto& r : records) {
        Cost record_cost = cost_for_record(pricing, r);
        BucketState& state = states[key_fn(r)];

        state.bucket.accumulate(r.input_tokens, r.output_tokens,
                                r.cache_creation_input_tokens,
                                r.cache_read_input_tokens, record_cost);
        state.projects.insert(r.project);
        state.tools.insert(r.provider);

        auto it = state.model_details.find(r.model);
        if (it == state.model_details.end()) {
            ModelBucketDetail detail;
            detail.model = r.model;
            it = state.model_details.emplace(r.model, std::move(detail)).first;
        }
        it->second.accumulate(r, record_cost);
    }

    std::map<std::string, AggregatedBucket> out;
    for (auto& [key, state] : states) {
        AggregatedBucket bucket = std::move(state.bucket);

        // model_details iterates by model id, so ties keep that order
        std::vector<ModelBucketDetail> details;
        details.reserve(state.model_details.size());
        for (auto& [model, detail] : state.model_details) {
            details.push_back(std::move(detail));
        }
        std::stable_sort(details.begin(), details.end(),
            [](const ModelBucketDetail& a, const ModelBucketDetail& b) {
                return a.cost.value_or(0.0) > b.cost.value_or(0.0);
            });

        for (const auto& d : details) {
            bucket.models.push_back(short_model_name(d.model));
        }
        bucket.details = std::move(details);
        bucket.projects.assign(state.projects.begin(), state.projects.end());
        bucket.tools.assign(state.tools.begin(), state.tools.end());

        out.emplace(key, std::move(bucket));
    }
    return out;
}

AggregatedBucket total_of(const std::map<std::string, AggregatedBucket>& buckets) {
    AggregatedBucket total;
    for (const auto& [key, bucket] : buckets) {
        total.accumulate_from(bucket);
    }
    return total;
}

} // namespace tku
