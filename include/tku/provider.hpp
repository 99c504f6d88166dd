#pragma once

#include <tku/pipeline.hpp>
#include <tku/result.hpp>
#include <tku/storage.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tku {

// One AI coding tool whose local logs we read
class Provider {
public:
    virtual ~Provider() = default;

    // Namespace key in the cache; stable across releases
    virtual const char* name() const = 0;

    // Directories searched for logs, after env overrides are applied
    virtual std::vector<std::filesystem::path> root_dirs() const = 0;

    // Discover this provider's files and bring its cache partition up to date
    virtual ScanStats discover_and_parse(Storage& storage,
                                         const ProgressFn* progress,
                                         unsigned workers) const = 0;
};

// Every registered provider, in report order
std::vector<std::unique_ptr<Provider>> all_providers();

// Names of all_providers(), same order
std::vector<std::string> provider_names();

// (provider, completed, total)
using ScanProgressFn = std::function<void(const std::string&, size_t, size_t)>;

// Scan each provider in turn, flush the cache and hand back every cached
// record. Records come out in no particular order.
Result<std::vector<UsageRecord>> collect_records(
    const std::vector<std::unique_ptr<Provider>>& providers,
    Storage& storage,
    const ScanProgressFn* progress,
    unsigned workers);

} // namespace tku
