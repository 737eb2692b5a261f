#pragma once
#include "../cache.hpp"
#include "../config.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace epss {

// Relational backend on SQLite. One table keyed by cache_key with
// created_at / expires_at columns (epoch seconds, expires_at nullable).
class SqliteCache : public Cache {
public:
    // Accepts "sqlite:///<path>" and "sqlite:///:memory:".
    // Throws std::invalid_argument for other URLs or a bad table name,
    // std::runtime_error when the database cannot be opened.
    explicit SqliteCache(const DatabaseConfig& config);
    ~SqliteCache() override;

    // Non-copyable
    SqliteCache(const SqliteCache&) = delete;
    SqliteCache& operator=(const SqliteCache&) = delete;

    std::string backend_name() const override { return "database"; }

    // Expired rows are deleted inside the same transaction and reported
    // as a miss.
    LookupResult get(const std::string& key) override;
    WriteResult set(const std::string& key, const nlohmann::json& value,
                    std::optional<uint32_t> ttl_seconds) override;
    WriteResult remove(const std::string& key) override;
    WriteResult clear() override;
    WriteResult exists(const std::string& key) override;
    void close() override;

    const std::string& table_name() const { return table_; }

private:
    void init_schema();
    std::string db_error() const;

    DatabaseConfig config_;
    std::string table_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

// BEGIN IMMEDIATE on construction. The destructor rolls back unless
// commit() succeeded; a COMMIT that fails (e.g. SQLITE_BUSY) leaves the
// transaction open so it is still rolled back.
class SqliteTransaction {
public:
    explicit SqliteTransaction(sqlite3* db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    bool active() const { return active_; }
    bool commit();

private:
    sqlite3* db_;
    bool active_ = false;
};

// Resolve "sqlite:///..." to a filesystem path (or ":memory:").
// Throws std::invalid_argument for unsupported schemes.
std::string sqlite_path_from_url(const std::string& url);

} // namespace epss
