#include <tku/providers/opencode.hpp>
#include <tku/providers/common.hpp>
#include <tku/json_util.hpp>

namespace fs = std::filesystem;

namespace tku {

std::vector<fs::path> OpenCodeProvider::root_dirs() const {
    return compute_provider_roots("OPENCODE_DATA_DIR", {"storage"}, {
        {XdgBase::Data, {"opencode", "storage"}},
    });
}

ScanStats OpenCodeProvider::discover_and_parse(Storage& storage, const ProgressFn* progress,
                                               unsigned workers) const {
    auto roots = root_dirs();
    SessionProjects sessions = load_opencode_sessions(roots);

    std::vector<fs::path> message_roots;
    for (const auto& r : roots) message_roots.push_back(r / "message");
    auto files = discover_files(message_roots, "json");

    // Session metadata is read-only once the workers start
    return discover_and_parse_with(name(), files, storage, progress,
        [&sessions](const fs::path& p) { return parse_opencode_message(p, sessions); },
        workers);
}

SessionProjects load_opencode_sessions(const std::vector<fs::path>& roots) {
    SessionProjects map;
    std::vector<fs::path> session_dirs;
    for (const auto& r : roots) session_dirs.push_back(r / "session");

    for (const auto& file : discover_files(session_dirs, "json")) {
        auto content = read_text_file(file.path);
        if (!content) continue;
        auto parsed = json::parse(*content);
        if (parsed.is_err()) continue;

        auto id = json::get_string(parsed.value(), "id");
        if (!id) continue;

        std::string project;
        if (auto dir = json::get_string(parsed.value(), "directory")) {
            project = last_path_segment(*dir);
        }
        if (project.empty()) {
            project = json::get_string(parsed.value(), "projectID").value_or("opencode");
        }
        map[*id] = project;
    }
    return map;
}

std::vector<UsageRecord> parse_opencode_message(const fs::path& path,
                                                const SessionProjects& sessions) {
    std::vector<UsageRecord> records;
    auto content = read_text_file(path);
    if (!content) return records;
    auto parsed = json::parse(*content);
    if (parsed.is_err()) return records;
    const Json::Value& msg = parsed.value();

    auto id = json::get_string(msg, "id");
    auto model = json::get_string(msg, "modelID");
    if (!id || !json::get_string(msg, "providerID") || !model) return records;

    const Json::Value* time = json::get_object(msg, "time");
    std::optional<int64_t> created;
    if (time) created = json::get_i64(*time, "created");
    const Json::Value* tokens = json::get_object(msg, "tokens");
    if (!created || !tokens) return records;

    UsageRecord r;
    r.provider = "opencode";
    r.session_id = json::get_string(msg, "sessionID").value_or("unknown");
    r.timestamp = timestamp_from_millis(*created);
    r.model = *model;
    r.message_id = *id;
    r.input_tokens = json::get_u64(*tokens, "input").value_or(0);
    r.output_tokens = json::get_u64(*tokens, "output").value_or(0);
    if (const Json::Value* cache = json::get_object(*tokens, "cache")) {
        r.cache_read_input_tokens = json::get_u64(*cache, "read").value_or(0);
        r.cache_creation_input_tokens = json::get_u64(*cache, "write").value_or(0);
    }
    if (r.input_tokens == 0 && r.output_tokens == 0) return records;

    auto it = sessions.find(r.session_id);
    r.project = it != sessions.end() ? it->second : "opencode";
    records.push_back(std::move(r));
    return records;
}

} // namespace tku
