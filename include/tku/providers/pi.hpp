#pragma once

#include <tku/provider.hpp>

namespace tku {

// pi coding agent: ~/.pi/agent/sessions/<project>/<ts>_<session>.jsonl
class PiProvider : public Provider {
public:
    const char* name() const override { return "pi"; }
    std::vector<std::filesystem::path> root_dirs() const override;
    ScanStats discover_and_parse(Storage& storage, const ProgressFn* progress,
                                 unsigned workers) const override;
};

std::vector<UsageRecord> parse_pi_file(const std::filesystem::path& path);

// Part of the file stem after the first '_', else the whole stem
std::string pi_session_id(const std::filesystem::path& path);

// Directory directly under "sessions/", else "pi"
std::string pi_project(const std::filesystem::path& path);

} // namespace tku
