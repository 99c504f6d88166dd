#include <tku/sqlite_store.hpp>
#include <tku/log.hpp>

#include <sqlite3.h>
#include <filesystem>
#include <unordered_set>

namespace fs = std::filesystem;

namespace tku {

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

struct SqliteStorage::Impl {
    sqlite3* db = nullptr;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_lookup_file = nullptr;
    sqlite3_stmt* stmt_upsert_file = nullptr;
    sqlite3_stmt* stmt_del_records = nullptr;
    sqlite3_stmt* stmt_insert_record = nullptr;
    sqlite3_stmt* stmt_list_files = nullptr;
    sqlite3_stmt* stmt_del_file = nullptr;
    sqlite3_stmt* stmt_all_records = nullptr;
    sqlite3_stmt* stmt_count_files = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_lookup_file);
        fin(stmt_upsert_file);
        fin(stmt_del_records);
        fin(stmt_insert_record);
        fin(stmt_list_files);
        fin(stmt_del_file);
        fin(stmt_all_records);
        fin(stmt_count_files);
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (!db) return TkuError(TkuError::Storage, "cache database is not open");
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return TkuError(TkuError::Storage,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return TkuError(TkuError::Storage, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status step_done(sqlite3_stmt* stmt, const char* what) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            return TkuError(TkuError::Storage,
                std::string(what) + ": " + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Result<int> user_version() {
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db, "PRAGMA user_version", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return TkuError(TkuError::Storage,
                std::string("Failed to read schema version: ") + sqlite3_errmsg(db));
        }
        int version = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return Result<int>::ok(version);
    }

    Status create_schema() {
        TKU_TRY(exec(
            "CREATE TABLE IF NOT EXISTS files ("
            "  file_id INTEGER PRIMARY KEY,"
            "  provider TEXT NOT NULL,"
            "  path TEXT NOT NULL,"
            "  mtime_secs INTEGER NOT NULL,"
            "  size INTEGER NOT NULL,"
            "  UNIQUE (provider, path)"
            ");"
            "CREATE TABLE IF NOT EXISTS records ("
            "  file_id INTEGER NOT NULL REFERENCES files(file_id) ON DELETE CASCADE,"
            "  session_id TEXT NOT NULL,"
            "  timestamp_ms INTEGER NOT NULL,"
            "  project TEXT NOT NULL,"
            "  model TEXT NOT NULL,"
            "  message_id TEXT NOT NULL,"
            "  request_id TEXT NOT NULL,"
            "  input_tokens INTEGER NOT NULL,"
            "  output_tokens INTEGER NOT NULL,"
            "  cache_creation_input_tokens INTEGER NOT NULL,"
            "  cache_read_input_tokens INTEGER NOT NULL"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_records_file ON records(file_id);"
        ));
        std::string ver_sql = "PRAGMA user_version = " +
            std::to_string(SqliteStorage::SCHEMA_VERSION) + ";";
        return exec(ver_sql.c_str());
    }

    Status init_schema() {
        auto ver = user_version();
        if (ver.is_err()) return std::move(ver).error();

        int found = ver.value();
        if (found != 0 && found != SqliteStorage::SCHEMA_VERSION) {
            // Older or newer layout: the cache is disposable, start over
            log::info("cache schema version %d (expected %d); recreating",
                      found, SqliteStorage::SCHEMA_VERSION);
            TKU_TRY(exec(
                "DROP TABLE IF EXISTS records;"
                "DROP TABLE IF EXISTS files;"
            ));
        }
        return create_schema();
    }

    void rollback() {
        char* errmsg = nullptr;
        if (sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, &errmsg) != SQLITE_OK) {
            log::warn("SQLite rollback failed: %s", errmsg ? errmsg : "unknown error");
        }
        sqlite3_free(errmsg);
    }

    // Run `body` inside BEGIN/COMMIT, rolling back if it fails
    template<typename F>
    Status transaction(F&& body) {
        TKU_TRY(exec("BEGIN IMMEDIATE"));
        auto st = body();
        if (st.is_err()) {
            rollback();
            return st;
        }
        auto commit = exec("COMMIT");
        if (commit.is_err()) {
            rollback();
            return commit;
        }
        return ok_status();
    }
};

static std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// ---------------------------------------------------------------------------
// SqliteStorage public interface
// ---------------------------------------------------------------------------

SqliteStorage::SqliteStorage() : impl_(std::make_unique<Impl>()) {}
SqliteStorage::~SqliteStorage() = default;
SqliteStorage::SqliteStorage(SqliteStorage&&) noexcept = default;
SqliteStorage& SqliteStorage::operator=(SqliteStorage&&) noexcept = default;

Status SqliteStorage::open(const std::string& db_path) {
    close();

    bool in_memory = db_path == ":memory:";
    if (!in_memory) {
        fs::path parent = fs::path(db_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return TkuError(TkuError::IO,
                    "Failed to create cache directory: " + parent.string(),
                    ec.message());
            }
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return TkuError(TkuError::Storage,
            "Failed to open cache database " + db_path + ": " + err_msg);
    }

    auto setup = [&]() -> Status {
        if (!in_memory) {
            TKU_TRY(impl_->exec(
                "PRAGMA journal_mode=WAL;"
                "PRAGMA synchronous=NORMAL;"
            ));
        }
        TKU_TRY(impl_->exec("PRAGMA foreign_keys=ON;"));
        TKU_TRY(impl_->init_schema());
        return ok_status();
    };

    auto setup_result = setup();
    if (setup_result.is_err() && !in_memory) {
        // Not a database we can use; delete it and retry once
        log::warn("cache database %s is unusable (%s); recreating",
                  db_path.c_str(), setup_result.error().message.c_str());
        close();
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return TkuError(TkuError::Storage, "Failed to recreate cache database " + db_path);
        }
        auto retry = setup();
        if (retry.is_err()) {
            close();
            return retry;
        }
    } else if (setup_result.is_err()) {
        close();
        return setup_result;
    }

    log::debug("opened cache database %s", db_path.c_str());
    return ok_status();
}

void SqliteStorage::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool SqliteStorage::is_open() const {
    return impl_->db != nullptr;
}

bool SqliteStorage::is_cached(const std::string& provider, const std::string& path,
                              int64_t mtime, uint64_t size) {
    auto st = impl_->prepare(
        "SELECT mtime_secs, size FROM files WHERE provider = ? AND path = ?",
        impl_->stmt_lookup_file);
    if (st.is_err()) {
        log::warn("%s", st.error().message.c_str());
        return false;
    }

    sqlite3_stmt* stmt = impl_->stmt_lookup_file;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, provider.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, path.c_str(), -1, SQLITE_TRANSIENT);

    bool hit = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        hit = sqlite3_column_int64(stmt, 0) == mtime &&
              static_cast<uint64_t>(sqlite3_column_int64(stmt, 1)) == size;
    }
    sqlite3_reset(stmt);
    return hit;
}

Status SqliteStorage::insert(const std::string& provider, const std::string& path,
                             int64_t mtime, uint64_t size,
                             std::vector<UsageRecord> records) {
    TKU_TRY(impl_->prepare(
        "INSERT INTO files (provider, path, mtime_secs, size) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(provider, path) DO UPDATE SET "
        "mtime_secs = excluded.mtime_secs, size = excluded.size "
        "RETURNING file_id",
        impl_->stmt_upsert_file));
    TKU_TRY(impl_->prepare(
        "DELETE FROM records WHERE file_id = ?",
        impl_->stmt_del_records));
    TKU_TRY(impl_->prepare(
        "INSERT INTO records (file_id, session_id, timestamp_ms, project, model, "
        "message_id, request_id, input_tokens, output_tokens, "
        "cache_creation_input_tokens, cache_read_input_tokens) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        impl_->stmt_insert_record));

    return impl_->transaction([&]() -> Status {
        sqlite3_stmt* up = impl_->stmt_upsert_file;
        sqlite3_reset(up);
        sqlite3_bind_text(up, 1, provider.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(up, 2, path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(up, 3, mtime);
        sqlite3_bind_int64(up, 4, static_cast<int64_t>(size));
        if (sqlite3_step(up) != SQLITE_ROW) {
            std::string msg = sqlite3_errmsg(impl_->db);
            sqlite3_reset(up);
            return TkuError(TkuError::Storage, "Failed to upsert file " + path + ": " + msg);
        }
        int64_t file_id = sqlite3_column_int64(up, 0);
        sqlite3_reset(up);

        // Replace, never merge
        sqlite3_stmt* del = impl_->stmt_del_records;
        sqlite3_reset(del);
        sqlite3_bind_int64(del, 1, file_id);
        TKU_TRY(impl_->step_done(del, "Failed to clear records"));

        sqlite3_stmt* ins = impl_->stmt_insert_record;
        for (const auto& r : records) {
            sqlite3_reset(ins);
            sqlite3_bind_int64(ins, 1, file_id);
            sqlite3_bind_text(ins, 2, r.session_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(ins, 3, timestamp_to_millis(r.timestamp));
            sqlite3_bind_text(ins, 4, r.project.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(ins, 5, r.model.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(ins, 6, r.message_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(ins, 7, r.request_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(ins, 8, static_cast<int64_t>(r.input_tokens));
            sqlite3_bind_int64(ins, 9, static_cast<int64_t>(r.output_tokens));
            sqlite3_bind_int64(ins, 10, static_cast<int64_t>(r.cache_creation_input_tokens));
            sqlite3_bind_int64(ins, 11, static_cast<int64_t>(r.cache_read_input_tokens));
            TKU_TRY(impl_->step_done(ins, "Failed to insert record"));
        }
        sqlite3_reset(ins);
        return ok_status();
    });
}

Status SqliteStorage::prune(const std::string& provider,
                            const std::vector<std::string>& existing) {
    TKU_TRY(impl_->prepare(
        "SELECT file_id, path FROM files WHERE provider = ?",
        impl_->stmt_list_files));
    TKU_TRY(impl_->prepare(
        "DELETE FROM files WHERE file_id = ?",
        impl_->stmt_del_file));
    TKU_TRY(impl_->prepare(
        "DELETE FROM records WHERE file_id = ?",
        impl_->stmt_del_records));

    std::unordered_set<std::string> known(existing.begin(), existing.end());

    std::vector<int64_t> stale;
    sqlite3_stmt* list = impl_->stmt_list_files;
    sqlite3_reset(list);
    sqlite3_bind_text(list, 1, provider.c_str(), -1, SQLITE_TRANSIENT);
    int rc;
    while ((rc = sqlite3_step(list)) == SQLITE_ROW) {
        if (known.count(column_string(list, 1)) == 0) {
            stale.push_back(sqlite3_column_int64(list, 0));
        }
    }
    sqlite3_reset(list);
    if (rc != SQLITE_DONE) {
        return TkuError(TkuError::Storage,
            std::string("Failed to list cached files: ") + sqlite3_errmsg(impl_->db));
    }
    if (stale.empty()) return ok_status();

    log::debug("pruning %zu vanished %s files from cache", stale.size(), provider.c_str());
    return impl_->transaction([&]() -> Status {
        for (int64_t id : stale) {
            sqlite3_stmt* dr = impl_->stmt_del_records;
            sqlite3_reset(dr);
            sqlite3_bind_int64(dr, 1, id);
            TKU_TRY(impl_->step_done(dr, "Failed to delete records"));

            sqlite3_stmt* df = impl_->stmt_del_file;
            sqlite3_reset(df);
            sqlite3_bind_int64(df, 1, id);
            TKU_TRY(impl_->step_done(df, "Failed to delete file"));
        }
        return ok_status();
    });
}

Status SqliteStorage::flush() {
    return ok_status();
}

Result<std::vector<UsageRecord>> SqliteStorage::drain_all() {
    TKU_TRY(impl_->prepare(
        "SELECT f.provider, r.session_id, r.timestamp_ms, r.project, r.model, "
        "r.message_id, r.request_id, r.input_tokens, r.output_tokens, "
        "r.cache_creation_input_tokens, r.cache_read_input_tokens "
        "FROM records r JOIN files f ON f.file_id = r.file_id",
        impl_->stmt_all_records));

    std::vector<UsageRecord> out;
    sqlite3_stmt* stmt = impl_->stmt_all_records;
    sqlite3_reset(stmt);
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        UsageRecord r;
        r.provider = column_string(stmt, 0);
        r.session_id = column_string(stmt, 1);
        r.timestamp = timestamp_from_millis(sqlite3_column_int64(stmt, 2));
        r.project = column_string(stmt, 3);
        r.model = column_string(stmt, 4);
        r.message_id = column_string(stmt, 5);
        r.request_id = column_string(stmt, 6);
        r.input_tokens = static_cast<uint64_t>(sqlite3_column_int64(stmt, 7));
        r.output_tokens = static_cast<uint64_t>(sqlite3_column_int64(stmt, 8));
        r.cache_creation_input_tokens = static_cast<uint64_t>(sqlite3_column_int64(stmt, 9));
        r.cache_read_input_tokens = static_cast<uint64_t>(sqlite3_column_int64(stmt, 10));
        out.push_back(std::move(r));
    }
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        return TkuError(TkuError::Storage,
            std::string("Failed to read cached records: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<std::vector<UsageRecord>>::ok(std::move(out));
}

Result<int64_t> SqliteStorage::file_count(const std::string& provider) {
    TKU_TRY(impl_->prepare(
        "SELECT COUNT(*) FROM files WHERE provider = ?",
        impl_->stmt_count_files));

    sqlite3_stmt* stmt = impl_->stmt_count_files;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, provider.c_str(), -1, SQLITE_TRANSIENT);
    int64_t n = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        n = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_reset(stmt);
    return Result<int64_t>::ok(n);
}

} // namespace tku
