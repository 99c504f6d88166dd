#include <tku/storage.hpp>
#include <tku/blob_store.hpp>
#include <tku/log.hpp>
#include <tku/sqlite_store.hpp>

#include <filesystem>

namespace fs = std::filesystem;

namespace tku {

Result<std::unique_ptr<Storage>> open_storage(const Config& config) {
    std::string dir = config.effective_cache_dir();
    if (dir.empty()) {
        return TkuError(TkuError::Config, "cannot determine cache directory",
            "set HOME, XDG_CACHE_HOME or [cache] dir in the config file");
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return TkuError(TkuError::IO,
            "failed to create cache directory: " + dir, ec.message());
    }

    std::unique_ptr<Storage> storage;
    switch (config.backend) {
    case CacheBackend::Blob:
        storage = std::make_unique<BlobStorage>(dir);
        break;
    case CacheBackend::Sqlite: {
        auto db = std::make_unique<SqliteStorage>();
        TKU_TRY(db->open((fs::path(dir) / "records.db").string()));
        storage = std::move(db);
        break;
    }
    }

    log::debug("using %s cache in %s", storage->backend_name(), dir.c_str());
    return Result<std::unique_ptr<Storage>>::ok(std::move(storage));
}

} // namespace tku
