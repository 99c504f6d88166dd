#pragma once

#include <tku/provider.hpp>

namespace tku {

// OpenAI Codex CLI: $CODEX_HOME/sessions/**/rollout-*.jsonl
class CodexProvider : public Provider {
public:
    const char* name() const override { return "codex"; }
    std::vector<std::filesystem::path> root_dirs() const override;
    ScanStats discover_and_parse(Storage& storage, const ProgressFn* progress,
                                 unsigned workers) const override;
};

std::vector<UsageRecord> parse_codex_file(const std::filesystem::path& path);

// Path relative to "sessions/", without ".jsonl"; else the file stem
std::string codex_session_id(const std::filesystem::path& path);

// First segment of the session id, "codex" when empty
std::string codex_project(const std::string& session_id);

} // namespace tku
