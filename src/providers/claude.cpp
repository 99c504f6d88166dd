#include <tku/providers/claude.hpp>
#include <tku/providers/common.hpp>
#include <tku/json_util.hpp>

namespace fs = std::filesystem;

namespace tku {

std::vector<fs::path> ClaudeProvider::root_dirs() const {
    return compute_provider_roots(nullptr, {}, {
        {XdgBase::Home, {".claude", "projects"}},
        {XdgBase::Config, {"claude", "projects"}},
    });
}

ScanStats ClaudeProvider::discover_and_parse(Storage& storage, const ProgressFn* progress,
                                             unsigned workers) const {
    auto files = discover_files(root_dirs(), "jsonl");
    return discover_and_parse_with(name(), files, storage, progress,
                                   parse_claude_file, workers);
}

static std::vector<std::string> split_nonempty(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) pos = s.size();
        if (pos > start) parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

static std::string join_from(const std::vector<std::string>& parts, size_t from) {
    std::string out;
    for (size_t i = from; i < parts.size(); ++i) {
        if (i > from) out += '-';
        out += parts[i];
    }
    return out;
}

std::string claude_project_name(const std::string& encoded) {
    auto parts = split_nonempty(encoded, '-');

    // First match wins: "git", then the usual source-tree markers
    static const char* const markers[] = {"git", "projects", "src", "code", "repos", "workspace"};
    for (const char* marker : markers) {
        for (size_t i = 0; i < parts.size(); ++i) {
            if (parts[i] == marker) {
                if (i + 1 < parts.size()) return join_from(parts, i + 1);
                break;
            }
        }
    }

    if (parts.size() >= 3 && parts[0] == "home") return join_from(parts, 2);
    if (parts.empty()) return "unknown";
    return parts.back();
}

std::string claude_project_from_path(const fs::path& path) {
    for (fs::path dir = path.parent_path(); !dir.empty() && dir != dir.parent_path();
         dir = dir.parent_path()) {
        if (dir.parent_path().filename() == "projects") {
            return claude_project_name(dir.filename().string());
        }
    }
    return "unknown";
}

static std::optional<UsageRecord> extract_claude_record(const Json::Value& line,
                                                        const std::string& session_id,
                                                        const std::string& project) {
    auto type = json::get_string(line, "type");
    if (!type) return std::nullopt;

    const Json::Value* message = nullptr;
    std::optional<std::string> ts;
    std::optional<std::string> request_id;

    if (*type == "assistant") {
        message = json::get_object(line, "message");
        ts = json::get_string(line, "timestamp");
        request_id = json::get_string(line, "requestId");
    } else if (*type == "progress") {
        // Sub-agent turns arrive wrapped in the parent session's log
        const Json::Value* data = json::get_object(line, "data");
        if (!data || json::get_string(*data, "type") != "agent_progress") return std::nullopt;
        const Json::Value* outer = json::get_object(*data, "message");
        if (!outer) return std::nullopt;
        message = json::get_object(*outer, "message");
        ts = json::get_string(*outer, "timestamp");
        if (!ts) ts = json::get_string(line, "timestamp");
        request_id = json::get_string(*outer, "requestId");
    } else {
        return std::nullopt;
    }
    if (!message) return std::nullopt;

    const Json::Value* usage = json::get_object(*message, "usage");
    if (!usage || !ts) return std::nullopt;

    auto timestamp = parse_timestamp(*ts);
    if (timestamp.is_err()) return std::nullopt;

    auto model = json::get_string(*message, "model");
    if (!model || *model == "<synthetic>") return std::nullopt;

    UsageRecord r;
    r.provider = "claude";
    r.session_id = session_id;
    r.timestamp = timestamp.value();
    auto cwd = json::get_string(line, "cwd");
    r.project = cwd ? last_path_segment(*cwd) : project;
    r.model = *model;
    r.message_id = json::get_string(*message, "id").value_or("");
    r.request_id = request_id.value_or("");
    r.input_tokens = json::get_u64(*usage, "input_tokens").value_or(0);
    r.output_tokens = json::get_u64(*usage, "output_tokens").value_or(0);
    r.cache_creation_input_tokens = json::get_u64(*usage, "cache_creation_input_tokens").value_or(0);
    r.cache_read_input_tokens = json::get_u64(*usage, "cache_read_input_tokens").value_or(0);
    return r;
}

std::vector<UsageRecord> parse_claude_file(const fs::path& path) {
    std::string session_id = path.stem().string();
    if (session_id.empty()) session_id = "unknown";
    std::string project = claude_project_from_path(path);

    return parse_jsonl_lines(path, "\"type\":", [&](const std::string& line)
                                                    -> std::optional<UsageRecord> {
        if (line.find("\"type\":\"assistant\"") == std::string::npos &&
            line.find("\"type\":\"progress\"") == std::string::npos) {
            return std::nullopt;
        }
        auto parsed = json::parse(line);
        if (parsed.is_err()) return std::nullopt;
        return extract_claude_record(parsed.value(), session_id, project);
    });
}

} // namespace tku
