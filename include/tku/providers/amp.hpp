#pragma once

#include <tku/provider.hpp>

namespace tku {

// Amp: one JSON document per thread under $XDG_DATA_HOME/amp/threads
class AmpProvider : public Provider {
public:
    const char* name() const override { return "amp"; }
    std::vector<std::filesystem::path> root_dirs() const override;
    ScanStats discover_and_parse(Storage& storage, const ProgressFn* progress,
                                 unsigned workers) const override;
};

// Records from usageLedger.events; cache tokens come from the assistant
// message each event points at through toMessageId.
std::vector<UsageRecord> parse_amp_file(const std::filesystem::path& path);

} // namespace tku
