#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace epss {

// Raised by CacheConfig::from_file for a missing, unsupported or malformed file.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RedisConfig {
    std::string host = "localhost";
    uint16_t port = 6379;
    uint32_t db = 0;
    std::optional<std::string> password;
    double socket_timeout = 5.0;          // seconds, per read/write
    double socket_connect_timeout = 5.0;  // seconds
    uint32_t max_connections = 10;
};

struct DatabaseConfig {
    std::string url = "sqlite:///~/.cache/epss/cache.db";
    std::string table_name = "epss_cache";
    uint32_t pool_size = 5;
    uint32_t max_overflow = 10;
    uint32_t pool_timeout = 30;           // seconds
};

struct FileConfig {
    std::string directory = "~/.cache/epss";
    int64_t max_size_mb = 100;            // <= 0 disables size eviction
    bool compression = true;
    std::string format = "json";          // "json" or "cbor"
};

struct CacheConfig {
    bool enabled = false;
    std::string backend = "file";         // "file", "redis" or "database"
    uint32_t ttl = 3600;
    std::string key_prefix = "epss";

    RedisConfig redis;
    DatabaseConfig database;
    FileConfig file;

    // Build from a parsed document holding a top-level "cache" object.
    // Missing or mistyped fields keep their defaults.
    static CacheConfig from_json(const nlohmann::json& j);

    // Load a settings file, picked by extension: .json, .yaml/.yml or
    // .toml (pyproject.toml reads [tool.epss.cache]). Throws ConfigError.
    static CacheConfig from_file(const std::string& path);

    // Build from EPSS_CACHE_* environment variables over defaults.
    static CacheConfig from_env();

    // Precedence: explicit file > default file locations > environment > defaults.
    // Never throws; load failures are logged.
    static CacheConfig load(const std::optional<std::string>& config_file = std::nullopt);

    // Default settings document (used by `epss cache config` and tests)
    static nlohmann::json defaults_json();

    // Serialise the settings (password omitted)
    nlohmann::json to_json() const;
};

} // namespace epss
