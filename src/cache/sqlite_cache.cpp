#include "sqlite_cache.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <cctype>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <stdexcept>

namespace epss {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

SqliteTransaction::SqliteTransaction(sqlite3* db) : db_(db) {
    active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) == SQLITE_OK;
}

SqliteTransaction::~SqliteTransaction() {
    if (active_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
}

bool SqliteTransaction::commit() {
    if (!active_) return false;
    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) return false;
    active_ = false;
    return true;
}

std::string sqlite_path_from_url(const std::string& url) {
    static const std::string scheme = "sqlite://";
    if (url.rfind(scheme, 0) != 0) {
        throw std::invalid_argument("Unsupported database URL (only sqlite is available): " + url);
    }

    std::string rest = url.substr(scheme.size());
    if (rest.empty()) return ":memory:";
    if (rest[0] != '/') {
        throw std::invalid_argument("Malformed sqlite URL: " + url);
    }
    rest.erase(0, 1);
    if (rest.empty() || rest == ":memory:") return ":memory:";
    return expand_home(rest);
}

static bool valid_identifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

SqliteCache::SqliteCache(const DatabaseConfig& config)
    : config_(config), table_(config.table_name) {
    if (!valid_identifier(table_)) {
        throw std::invalid_argument("SqliteCache: invalid table name: " + table_);
    }

    std::string path = sqlite_path_from_url(config_.url);
    if (path != ":memory:") {
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
    }

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteCache: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(config_.pool_timeout) * 1000);
    for (const char* pragma : {"PRAGMA journal_mode=WAL;", "PRAGMA synchronous=NORMAL;"}) {
        char* errmsg = nullptr;
        if (sqlite3_exec(db_, pragma, nullptr, nullptr, &errmsg) != SQLITE_OK) {
            std::cerr << "[sqlite_cache] " << pragma << " failed: "
                      << (errmsg ? errmsg : "unknown error") << "\n";
        }
        sqlite3_free(errmsg);
    }

    init_schema();
}

SqliteCache::~SqliteCache() {
    close();
}

void SqliteCache::init_schema() {
    std::string create_table =
        "CREATE TABLE IF NOT EXISTS " + table_ + " ("
        "  cache_key  VARCHAR(255) PRIMARY KEY,"
        "  data       TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  expires_at INTEGER"
        ");";
    char* errmsg = nullptr;
    if (sqlite3_exec(db_, create_table.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string err = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("SqliteCache: failed to create table: " + err);
    }
}

std::string SqliteCache::db_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database is closed";
}

LookupResult SqliteCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return LookupResult::failure(CacheErrorKind::Database, "database is closed");

    SqliteTransaction tx(db_);
    if (!tx.active()) return LookupResult::failure(CacheErrorKind::Database, db_error());

    std::string data;
    bool found = false;
    bool expired = false;
    {
        StmtGuard g;
        std::string sql = "SELECT data, expires_at FROM " + table_ + " WHERE cache_key = ?;";
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
            return LookupResult::failure(CacheErrorKind::Database, db_error());
        }
        sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);

        int rc = sqlite3_step(g.stmt);
        if (rc == SQLITE_ROW) {
            found = true;
            if (auto* v = sqlite3_column_text(g.stmt, 0)) data = reinterpret_cast<const char*>(v);
            if (sqlite3_column_type(g.stmt, 1) != SQLITE_NULL) {
                auto expires_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 1));
                expired = epoch_seconds() > expires_at;
            }
        } else if (rc != SQLITE_DONE) {
            return LookupResult::failure(CacheErrorKind::Database, db_error());
        }
    }

    if (found && expired) {
        StmtGuard g;
        std::string sql = "DELETE FROM " + table_ + " WHERE cache_key = ?;";
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
            return LookupResult::failure(CacheErrorKind::Database, db_error());
        }
        sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            return LookupResult::failure(CacheErrorKind::Database, db_error());
        }
    }

    if (!tx.commit()) return LookupResult::failure(CacheErrorKind::Database, db_error());
    if (!found || expired) return LookupResult::success(std::nullopt);

    try {
        return LookupResult::success(std::optional<nlohmann::json>(nlohmann::json::parse(data)));
    } catch (const nlohmann::json::exception& e) {
        return LookupResult::failure(CacheErrorKind::Corrupt, e.what());
    }
}

WriteResult SqliteCache::set(const std::string& key, const nlohmann::json& value,
                             std::optional<uint32_t> ttl_seconds) {
    std::string data;
    try {
        data = value.dump();
    } catch (const nlohmann::json::exception& e) {
        return WriteResult::failure(CacheErrorKind::Serialization, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return WriteResult::failure(CacheErrorKind::Database, "database is closed");

    std::string sql =
        "INSERT INTO " + table_ + " (cache_key, data, created_at, expires_at) "
        "VALUES (?, ?, ?, ?) "
        "ON CONFLICT(cache_key) DO UPDATE SET "
        "  data = excluded.data,"
        "  created_at = excluded.created_at,"
        "  expires_at = excluded.expires_at;";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return WriteResult::failure(CacheErrorKind::Database, db_error());
    }

    auto now = static_cast<int64_t>(epoch_seconds());
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, data.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 3, now);
    if (ttl_seconds && *ttl_seconds > 0) {
        sqlite3_bind_int64(g.stmt, 4, now + static_cast<int64_t>(*ttl_seconds));
    } else {
        sqlite3_bind_null(g.stmt, 4);
    }

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        return WriteResult::failure(CacheErrorKind::Database, db_error());
    }
    return WriteResult::success(true);
}

WriteResult SqliteCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return WriteResult::failure(CacheErrorKind::Database, "database is closed");

    StmtGuard g;
    std::string sql = "DELETE FROM " + table_ + " WHERE cache_key = ?;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return WriteResult::failure(CacheErrorKind::Database, db_error());
    }
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        return WriteResult::failure(CacheErrorKind::Database, db_error());
    }
    return WriteResult::success(sqlite3_changes(db_) > 0);
}

WriteResult SqliteCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return WriteResult::failure(CacheErrorKind::Database, "database is closed");

    std::string sql = "DELETE FROM " + table_ + ";";
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr) != SQLITE_OK) {
        return WriteResult::failure(CacheErrorKind::Database, db_error());
    }
    return WriteResult::success(true);
}

WriteResult SqliteCache::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return WriteResult::failure(CacheErrorKind::Database, "database is closed");

    StmtGuard g;
    std::string sql = "SELECT COUNT(*) FROM " + table_ +
                      " WHERE cache_key = ? AND (expires_at IS NULL OR expires_at >= ?);";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        return WriteResult::failure(CacheErrorKind::Database, db_error());
    }
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(epoch_seconds()));
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        return WriteResult::failure(CacheErrorKind::Database, db_error());
    }
    return WriteResult::success(sqlite3_column_int64(g.stmt, 0) > 0);
}

void SqliteCache::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

} // namespace epss
