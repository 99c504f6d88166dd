#include <tku/providers/codex.hpp>
#include <tku/providers/common.hpp>
#include <tku/json_util.hpp>

namespace fs = std::filesystem;

namespace tku {

static const char* const DEFAULT_CODEX_MODEL = "gpt-5";

std::vector<fs::path> CodexProvider::root_dirs() const {
    return compute_provider_roots("CODEX_HOME", {"sessions"}, {
        {XdgBase::Home, {".codex", "sessions"}},
        {XdgBase::Config, {"codex", "sessions"}},
    });
}

ScanStats CodexProvider::discover_and_parse(Storage& storage, const ProgressFn* progress,
                                            unsigned workers) const {
    auto files = discover_files(root_dirs(), "jsonl");
    return discover_and_parse_with(name(), files, storage, progress,
                                   parse_codex_file, workers);
}

std::string codex_session_id(const fs::path& path) {
    static const std::string marker = "/sessions/";
    std::string s = path.generic_string();
    auto idx = s.find(marker);
    if (idx != std::string::npos) {
        std::string rel = s.substr(idx + marker.size());
        static const std::string ext = ".jsonl";
        if (rel.size() >= ext.size() &&
            rel.compare(rel.size() - ext.size(), ext.size(), ext) == 0) {
            rel.erase(rel.size() - ext.size());
        }
        return rel;
    }
    std::string stem = path.stem().string();
    return stem.empty() ? "unknown" : stem;
}

std::string codex_project(const std::string& session_id) {
    std::string first = session_id.substr(0, session_id.find('/'));
    return first.empty() ? "codex" : first;
}

// Model named by a payload, checked in order of specificity
static std::optional<std::string> payload_model(const Json::Value& payload) {
    if (const Json::Value* info = json::get_object(payload, "info")) {
        if (auto m = json::get_string(*info, "model")) return m;
        if (const Json::Value* md = json::get_object(*info, "metadata")) {
            if (auto m = json::get_string(*md, "model")) return m;
        }
    }
    if (auto m = json::get_string(payload, "model")) return m;
    if (const Json::Value* md = json::get_object(payload, "metadata")) {
        if (auto m = json::get_string(*md, "model")) return m;
    }
    return std::nullopt;
}

struct TokenTriple {
    uint64_t input = 0;
    uint64_t output = 0;
    uint64_t cached = 0;
};

static TokenTriple read_usage(const Json::Value& usage) {
    TokenTriple t;
    t.input = json::get_u64(usage, "input_tokens").value_or(0);
    t.output = json::get_u64(usage, "output_tokens").value_or(0);
    auto cached = json::get_u64(usage, "cached_input_tokens");
    if (!cached) cached = json::get_u64(usage, "cache_read_input_tokens");
    t.cached = cached.value_or(0);
    return t;
}

static uint64_t saturating_sub(uint64_t a, uint64_t b) {
    return a > b ? a - b : 0;
}

namespace {

// Per-file parse state: the last model announced by a turn_context and the
// previous cumulative totals
struct CodexSession {
    std::string session_id;
    std::string project;
    std::optional<std::string> last_model;
    TokenTriple prev_totals;

    std::optional<UsageRecord> token_event(const Json::Value& line);
};

std::optional<UsageRecord> CodexSession::token_event(const Json::Value& line) {
    const Json::Value* payload = json::get_object(line, "payload");
    if (!payload || json::get_string(*payload, "type") != "token_count") return std::nullopt;

    const Json::Value* info = json::get_object(*payload, "info");
    if (!info) return std::nullopt;

    auto ts = json::get_string(line, "timestamp");
    if (!ts) return std::nullopt;
    auto timestamp = parse_timestamp(*ts);
    if (timestamp.is_err()) return std::nullopt;

    std::string model = payload_model(*payload)
        .value_or(last_model.value_or(DEFAULT_CODEX_MODEL));

    TokenTriple delta;
    if (const Json::Value* last = json::get_object(*info, "last_token_usage")) {
        delta = read_usage(*last);
    } else if (const Json::Value* total = json::get_object(*info, "total_token_usage")) {
        TokenTriple cur = read_usage(*total);
        delta.input = saturating_sub(cur.input, prev_totals.input);
        delta.output = saturating_sub(cur.output, prev_totals.output);
        delta.cached = saturating_sub(cur.cached, prev_totals.cached);
        prev_totals = cur;
    } else {
        return std::nullopt;
    }

    if (delta.input == 0 && delta.output == 0 && delta.cached == 0) return std::nullopt;

    UsageRecord r;
    r.provider = "codex";
    r.session_id = session_id;
    r.timestamp = timestamp.value();
    r.project = project;
    r.model = std::move(model);
    // Codex logs carry no message id; synthesize a stable one
    r.message_id = "codex:" + session_id + ":" + format_timestamp(r.timestamp) + ":" +
                   std::to_string(delta.input) + ":" + std::to_string(delta.output);
    r.input_tokens = delta.input;
    r.output_tokens = delta.output;
    r.cache_read_input_tokens = delta.cached;
    return r;
}

} // namespace

std::vector<UsageRecord> parse_codex_file(const fs::path& path) {
    CodexSession session;
    session.session_id = codex_session_id(path);
    session.project = codex_project(session.session_id);

    // turn_context lines update the running model and produce no record
    return parse_jsonl_lines(path, "\"type\"", [&](const std::string& line)
                                              -> std::optional<UsageRecord> {
        if (line.find("\"turn_context\"") != std::string::npos) {
            auto parsed = json::parse(line);
            if (parsed.is_ok()) {
                if (const Json::Value* payload = json::get_object(parsed.value(), "payload")) {
                    if (auto m = payload_model(*payload)) session.last_model = std::move(m);
                }
            }
            return std::nullopt;
        }
        if (line.find("\"token_count\"") == std::string::npos) return std::nullopt;

        auto parsed = json::parse(line);
        if (parsed.is_err()) return std::nullopt;
        return session.token_event(parsed.value());
    });
}

} // namespace tku
