#pragma once

#include <tku/provider.hpp>

namespace tku {

// Claude Code: ~/.claude/projects/<encoded-cwd>/<session>.jsonl
class ClaudeProvider : public Provider {
public:
    const char* name() const override { return "claude"; }
    std::vector<std::filesystem::path> root_dirs() const override;
    ScanStats discover_and_parse(Storage& storage, const ProgressFn* progress,
                                 unsigned workers) const override;
};

std::vector<UsageRecord> parse_claude_file(const std::filesystem::path& path);

// "-home-alice-src-my-app" -> "my-app"
std::string claude_project_name(const std::string& encoded);

// Project for a session file, from the folder directly under "projects"
std::string claude_project_from_path(const std::filesystem::path& path);

} // namespace tku
