#pragma once

#include <tku/config.hpp>
#include <tku/record.hpp>
#include <tku/result.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tku {

// Persistent cache of parsed records, keyed by (provider, file path) and
// guarded by the file's (mtime, size) fingerprint.
//
// Not thread-safe: the scan pipeline only touches it from the coordinating
// thread.
class Storage {
public:
    virtual ~Storage() = default;

    // True only if an entry exists whose fingerprint equals (mtime, size)
    virtual bool is_cached(const std::string& provider, const std::string& path,
                           int64_t mtime, uint64_t size) = 0;

    // Replace the entry for (provider, path). Never merges with the old list.
    virtual Status insert(const std::string& provider, const std::string& path,
                          int64_t mtime, uint64_t size,
                          std::vector<UsageRecord> records) = 0;

    // Delete every entry of `provider` whose path is not in `existing`
    virtual Status prune(const std::string& provider,
                         const std::vector<std::string>& existing) = 0;

    // Persist pending changes. No-op when nothing changed.
    virtual Status flush() = 0;

    // Hand over every cached record. Call once per run, after flush().
    // Order is unspecified.
    virtual Result<std::vector<UsageRecord>> drain_all() = 0;

    virtual const char* backend_name() const = 0;
};

// Open the backend chosen in `config` under its cache directory. Failing to
// open durable storage is the only fatal storage error.
Result<std::unique_ptr<Storage>> open_storage(const Config& config);

} // namespace tku
