#include <tku/providers/pi.hpp>
#include <tku/providers/common.hpp>
#include <tku/json_util.hpp>

namespace fs = std::filesystem;

namespace tku {

std::vector<fs::path> PiProvider::root_dirs() const {
    return compute_provider_roots("PI_AGENT_DIR", {"sessions"}, {
        {XdgBase::Home, {".pi", "agent", "sessions"}},
        {XdgBase::Config, {"pi", "agent", "sessions"}},
    });
}

ScanStats PiProvider::discover_and_parse(Storage& storage, const ProgressFn* progress,
                                         unsigned workers) const {
    auto files = discover_files(root_dirs(), "jsonl");
    return discover_and_parse_with(name(), files, storage, progress,
                                   parse_pi_file, workers);
}

std::string pi_session_id(const fs::path& path) {
    std::string stem = path.stem().string();
    if (stem.empty()) return "unknown";
    auto idx = stem.find('_');
    if (idx != std::string::npos && idx + 1 < stem.size()) {
        return stem.substr(idx + 1);
    }
    return stem;
}

std::string pi_project(const fs::path& path) {
    static const std::string marker = "/sessions/";
    std::string s = path.generic_string();
    auto idx = s.find(marker);
    if (idx != std::string::npos) {
        std::string after = s.substr(idx + marker.size());
        auto slash = after.find('/');
        if (slash != std::string::npos && slash > 0) return after.substr(0, slash);
    }
    return "pi";
}

static std::optional<UsageRecord> extract_pi_record(const Json::Value& line,
                                                    const std::string& session_id,
                                                    const std::string& project) {
    auto ts = json::get_string(line, "timestamp");
    if (!ts) return std::nullopt;
    auto timestamp = parse_timestamp(*ts);
    if (timestamp.is_err()) return std::nullopt;

    const Json::Value* message = json::get_object(line, "message");
    if (!message || json::get_string(*message, "role") != "assistant") return std::nullopt;

    const Json::Value* usage = json::get_object(*message, "usage");
    if (!usage) return std::nullopt;
    auto input = json::get_u64(*usage, "input");
    auto output = json::get_u64(*usage, "output");
    if (!input || !output) return std::nullopt;

    UsageRecord r;
    r.provider = "pi";
    r.session_id = session_id;
    r.timestamp = timestamp.value();
    r.project = project;
    r.model = json::get_string(*message, "model").value_or("unknown");
    r.message_id = "pi:" + session_id + ":" + format_timestamp(r.timestamp) + ":" +
                   std::to_string(*input) + ":" + std::to_string(*output);
    r.input_tokens = *input;
    r.output_tokens = *output;
    r.cache_creation_input_tokens = json::get_u64(*usage, "cacheWrite").value_or(0);
    r.cache_read_input_tokens = json::get_u64(*usage, "cacheRead").value_or(0);
    return r;
}

std::vector<UsageRecord> parse_pi_file(const fs::path& path) {
    std::string session_id = pi_session_id(path);
    std::string project = pi_project(path);

    return parse_jsonl_lines(path, "\"assistant\"", [&](const std::string& line)
                                                        -> std::optional<UsageRecord> {
        auto parsed = json::parse(line);
        if (parsed.is_err()) return std::nullopt;
        return extract_pi_record(parsed.value(), session_id, project);
    });
}

} // namespace tku
