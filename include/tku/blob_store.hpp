#pragma once

#include <tku/storage.hpp>
#include <map>
#include <unordered_map>

namespace tku {

// One binary blob per provider: <dir>/<provider>.bin
//
// A provider's blob is read wholesale the first time that provider is
// touched, mutated in memory, and rewritten wholesale by flush() only if it
// changed. Writes go to a temp file that is renamed into place, so an
// interrupted run loses its own updates but never damages the old cache.
// An unreadable, truncated or older-format blob is discarded and rebuilt.
class BlobStorage : public Storage {
public:
    // Empty `dir` keeps everything in memory; flush() then writes nothing
    explicit BlobStorage(std::string dir);

    bool is_cached(const std::string& provider, const std::string& path,
                   int64_t mtime, uint64_t size) override;
    Status insert(const std::string& provider, const std::string& path,
                  int64_t mtime, uint64_t size,
                  std::vector<UsageRecord> records) override;
    Status prune(const std::string& provider,
                 const std::vector<std::string>& existing) override;
    Status flush() override;
    Result<std::vector<UsageRecord>> drain_all() override;
    const char* backend_name() const override { return "blob"; }

    std::string blob_path(const std::string& provider) const;

    static constexpr uint32_t FORMAT_VERSION = 1;

private:
    struct CachedFile {
        int64_t mtime_secs = 0;
        uint64_t size = 0;
        std::vector<UsageRecord> records;
    };

    struct ProviderCache {
        std::unordered_map<std::string, CachedFile> files;
        bool dirty = false;
    };

    ProviderCache& provider_cache(const std::string& provider);
    ProviderCache load(const std::string& provider) const;

    static std::vector<uint8_t> serialize(const ProviderCache& pc);
    static Result<ProviderCache> deserialize(const std::string& provider,
                                             const uint8_t* data, size_t len);

    std::string dir_;
    std::map<std::string, ProviderCache> providers_;
};

} // namespace tku
