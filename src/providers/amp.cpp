#include <tku/providers/amp.hpp>
#include <tku/providers/common.hpp>
#include <tku/json_util.hpp>

#include <unordered_map>

namespace fs = std::filesystem;

namespace tku {

std::vector<fs::path> AmpProvider::root_dirs() const {
    return compute_provider_roots("AMP_DATA_DIR", {"threads"}, {
        {XdgBase::Data, {"amp", "threads"}},
    });
}

ScanStats AmpProvider::discover_and_parse(Storage& storage, const ProgressFn* progress,
                                          unsigned workers) const {
    auto files = discover_files(root_dirs(), "json");
    return discover_and_parse_with(name(), files, storage, progress,
                                   parse_amp_file, workers);
}

struct CacheTokens {
    uint64_t creation = 0;
    uint64_t read = 0;
};

using CacheMap = std::unordered_map<uint64_t, CacheTokens>;

static CacheMap build_cache_map(const Json::Value& thread) {
    CacheMap map;
    const Json::Value& messages = thread["messages"];
    if (!messages.isArray()) return map;

    for (const auto& msg : messages) {
        if (json::get_string(msg, "role") != "assistant") continue;
        auto id = json::get_u64(msg, "messageId");
        const Json::Value* usage = json::get_object(msg, "usage");
        if (!id || !usage) continue;

        CacheTokens ct;
        ct.creation = json::get_u64(*usage, "cacheCreationInputTokens").value_or(0);
        ct.read = json::get_u64(*usage, "cacheReadInputTokens").value_or(0);
        map[*id] = ct;
    }
    return map;
}

static std::optional<UsageRecord> extract_ledger_event(const Json::Value& event,
                                                       const std::string& thread_id,
                                                       const CacheMap& cache) {
    auto ts = json::get_string(event, "timestamp");
    if (!ts) return std::nullopt;
    auto timestamp = parse_timestamp(*ts);
    if (timestamp.is_err()) return std::nullopt;

    const Json::Value* tokens = json::get_object(event, "tokens");
    if (!tokens) return std::nullopt;

    UsageRecord r;
    r.provider = "amp";
    r.session_id = thread_id;
    r.timestamp = timestamp.value();
    r.project = "amp";
    r.model = json::get_string(event, "model").value_or("unknown");
    r.message_id = json::get_string(event, "id").value_or("");
    r.input_tokens = json::get_u64(*tokens, "input").value_or(0);
    r.output_tokens = json::get_u64(*tokens, "output").value_or(0);

    if (auto to = json::get_u64(event, "toMessageId")) {
        auto it = cache.find(*to);
        if (it != cache.end()) {
            r.cache_creation_input_tokens = it->second.creation;
            r.cache_read_input_tokens = it->second.read;
        }
    }
    return r;
}

std::vector<UsageRecord> parse_amp_file(const fs::path& path) {
    std::vector<UsageRecord> records;
    auto content = read_text_file(path);
    if (!content) return records;

    auto parsed = json::parse(*content);
    if (parsed.is_err()) return records;
    const Json::Value& thread = parsed.value();

    const Json::Value* ledger = json::get_object(thread, "usageLedger");
    if (!ledger) return records;
    const Json::Value& events = (*ledger)["events"];
    if (!events.isArray()) return records;

    std::string thread_id = json::get_string(thread, "id").value_or("unknown");
    CacheMap cache = build_cache_map(thread);

    for (const auto& event : events) {
        if (auto r = extract_ledger_event(event, thread_id, cache)) {
            records.push_back(std::move(*r));
        }
    }
    return records;
}

} // namespace tku
