#include "cache.hpp"
#include "config.hpp"
#include "cache/file_cache.hpp"
#include "cache/redis_cache.hpp"
#include "cache/sqlite_cache.hpp"
#include <stdexcept>

namespace epss {

std::string error_kind_to_string(CacheErrorKind kind) {
    switch (kind) {
        case CacheErrorKind::Io:            return "io";
        case CacheErrorKind::Corrupt:       return "corrupt";
        case CacheErrorKind::Serialization: return "serialization";
        case CacheErrorKind::Connection:    return "connection";
        case CacheErrorKind::Protocol:      return "protocol";
        case CacheErrorKind::Database:      return "database";
    }
    return "unknown";
}

std::optional<CacheBackendKind> backend_kind_from_string(const std::string& name) {
    if (name == "file")     return CacheBackendKind::File;
    if (name == "redis")    return CacheBackendKind::Redis;
    if (name == "database") return CacheBackendKind::Database;
    return std::nullopt;
}

std::string backend_kind_to_string(CacheBackendKind kind) {
    switch (kind) {
        case CacheBackendKind::File:     return "file";
        case CacheBackendKind::Redis:    return "redis";
        case CacheBackendKind::Database: return "database";
    }
    return "unknown";
}

std::unique_ptr<Cache> create_cache(const CacheConfig& config) {
    auto kind = backend_kind_from_string(config.backend);
    if (!kind) {
        throw std::invalid_argument("Unknown cache backend: " + config.backend);
    }

    switch (*kind) {
        case CacheBackendKind::File:
            return std::make_unique<FileCache>(config.file, config.ttl);
        case CacheBackendKind::Redis:
            return std::make_unique<RedisCache>(config.redis, config.key_prefix);
        case CacheBackendKind::Database:
            return std::make_unique<SqliteCache>(config.database);
    }
    throw std::invalid_argument("Unknown cache backend: " + config.backend);
}

} // namespace epss
