#include <tku/dedup.hpp>

#include <algorithm>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

namespace tku {

static constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
static constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

static void fnv_bytes(uint64_t& h, const void* data, size_t len) {
    auto p = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < len; ++i) {
        h ^= p[i];
        h *= FNV_PRIME;
    }
}

// Length-prefixed so ("ab","c") and ("a","bc") hash differently
static void fnv_field(uint64_t& h, const std::string& s) {
    uint64_t len = s.size();
    fnv_bytes(h, &len, sizeof(len));
    fnv_bytes(h, s.data(), s.size());
}

uint64_t record_identity_hash(const UsageRecord& r) {
    uint64_t h = FNV_OFFSET;
    fnv_field(h, r.provider);
    fnv_field(h, r.message_id);
    fnv_field(h, r.request_id);
    return h;
}

std::vector<UsageRecord> dedup(std::vector<UsageRecord> records) {
    std::unordered_set<uint64_t> seen;
    seen.reserve(records.size());

    std::vector<UsageRecord> out;
    out.reserve(records.size());
    for (auto& r : records) {
        if (seen.insert(record_identity_hash(r)).second) {
            out.push_back(std::move(r));
        }
    }
    return out;
}

void sort_records(std::vector<UsageRecord>& records,
                  const std::vector<std::string>& provider_order) {
    std::unordered_map<std::string, size_t> rank;
    for (size_t i = 0; i < provider_order.size(); ++i) {
        rank.emplace(provider_order[i], i);
    }
    auto rank_of = [&](const std::string& provider) {
        auto it = rank.find(provider);
        return it == rank.end() ? provider_order.size() : it->second;
    };

    std::stable_sort(records.begin(), records.end(),
        [&](const UsageRecord& a, const UsageRecord& b) {
            size_t ra = rank_of(a.provider);
            size_t rb = rank_of(b.provider);
            // Every field takes part so that the order is total
            return std::tie(ra, a.provider, a.timestamp, a.session_id,
                            a.message_id, a.request_id, a.project, a.model,
                            a.input_tokens, a.output_tokens,
                            a.cache_creation_input_tokens,
                            a.cache_read_input_tokens) <
                   std::tie(rb, b.provider, b.timestamp, b.session_id,
                            b.message_id, b.request_id, b.project, b.model,
                            b.input_tokens, b.output_tokens,
                            b.cache_creation_input_tokens,
                            b.cache_read_input_tokens);
        });
}

} // namespace tku
