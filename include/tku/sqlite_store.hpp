#pragma once

#include <tku/storage.hpp>
#include <memory>

namespace tku {

// Records cache backed by a single SQLite database.
//
// Schema (versioned through PRAGMA user_version):
//   files(file_id, provider, path, mtime_secs, size)   UNIQUE(provider, path)
//   records(file_id -> files, one row per UsageRecord)
//
// Every insert and every prune runs in its own transaction, so the database
// is durable as soon as each call returns and flush() has nothing to do.
class SqliteStorage : public Storage {
public:
    SqliteStorage();
    ~SqliteStorage() override;
    SqliteStorage(SqliteStorage&&) noexcept;
    SqliteStorage& operator=(SqliteStorage&&) noexcept;

    // ":memory:" opens a private in-memory database
    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    bool is_cached(const std::string& provider, const std::string& path,
                   int64_t mtime, uint64_t size) override;
    Status insert(const std::string& provider, const std::string& path,
                  int64_t mtime, uint64_t size,
                  std::vector<UsageRecord> records) override;
    Status prune(const std::string& provider,
                 const std::vector<std::string>& existing) override;
    Status flush() override;
    Result<std::vector<UsageRecord>> drain_all() override;
    const char* backend_name() const override { return "sqlite"; }

    // Number of rows in `files` for one provider
    Result<int64_t> file_count(const std::string& provider);

    static constexpr int SCHEMA_VERSION = 3;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tku
