#pragma once

#include <tku/provider.hpp>
#include <unordered_map>

namespace tku {

// session id -> project name
using SessionProjects = std::unordered_map<std::string, std::string>;

// OpenCode: storage/message/**/<msg>.json, one assistant message per file,
// with session metadata under storage/session/
class OpenCodeProvider : public Provider {
public:
    const char* name() const override { return "opencode"; }
    std::vector<std::filesystem::path> root_dirs() const override;
    ScanStats discover_and_parse(Storage& storage, const ProgressFn* progress,
                                 unsigned workers) const override;
};

// Reads every <root>/session/**/*.json. Project is the basename of
// "directory", else "projectID", else "opencode".
SessionProjects load_opencode_sessions(const std::vector<std::filesystem::path>& roots);

std::vector<UsageRecord> parse_opencode_message(const std::filesystem::path& path,
                                                const SessionProjects& sessions);

} // namespace tku
