#include "redis_cache.hpp"
#include <sw/redis++/redis++.h>
#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace epss {

namespace {

std::chrono::milliseconds to_millis(double secs) {
    if (secs <= 0) return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(static_cast<long long>(secs * 1000.0));
}

const char* kClosed = "redis cache is closed";

} // namespace

std::string redis_glob_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

RedisCache::RedisCache(const RedisConfig& config, std::string key_prefix)
    : config_(config), key_prefix_(std::move(key_prefix)) {
    sw::redis::ConnectionOptions opts;
    opts.host = config_.host;
    opts.port = config_.port;
    opts.db = static_cast<int>(config_.db);
    if (config_.password && !config_.password->empty()) {
        opts.password = *config_.password;
    }
    opts.connect_timeout = to_millis(config_.socket_connect_timeout);
    opts.socket_timeout = to_millis(config_.socket_timeout);

    sw::redis::ConnectionPoolOptions pool;
    pool.size = std::max<std::size_t>(1, config_.max_connections);
    pool.wait_timeout = opts.connect_timeout;

    try {
        redis_ = std::make_shared<sw::redis::Redis>(opts, pool);
        redis_->ping();
    } catch (const sw::redis::Error& e) {
        throw std::runtime_error(std::string("Cannot connect to Redis: ") + e.what());
    }
}

RedisCache::~RedisCache() {
    close();
}

std::shared_ptr<sw::redis::Redis> RedisCache::client() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_;
}

LookupResult RedisCache::get(const std::string& key) {
    auto redis = client();
    if (!redis) return LookupResult::failure(CacheErrorKind::Connection, kClosed);

    sw::redis::OptionalString raw;
    try {
        raw = redis->get(key);
    } catch (const sw::redis::Error& e) {
        return LookupResult::failure(CacheErrorKind::Connection, e.what());
    }
    if (!raw) return LookupResult::success(std::nullopt);

    try {
        return LookupResult::success(
            std::optional<nlohmann::json>(nlohmann::json::parse(*raw)));
    } catch (const nlohmann::json::exception& e) {
        return LookupResult::failure(CacheErrorKind::Corrupt, e.what());
    }
}

WriteResult RedisCache::set(const std::string& key, const nlohmann::json& value,
                            std::optional<uint32_t> ttl_seconds) {
    auto redis = client();
    if (!redis) return WriteResult::failure(CacheErrorKind::Connection, kClosed);

    std::string text;
    try {
        text = value.dump();
    } catch (const nlohmann::json::exception& e) {
        return WriteResult::failure(CacheErrorKind::Serialization, e.what());
    }

    try {
        if (ttl_seconds && *ttl_seconds > 0) {
            redis->setex(key, std::chrono::seconds(*ttl_seconds), text);
            return WriteResult::success(true);
        }
        return WriteResult::success(redis->set(key, text));
    } catch (const sw::redis::Error& e) {
        return WriteResult::failure(CacheErrorKind::Connection, e.what());
    }
}

WriteResult RedisCache::remove(const std::string& key) {
    auto redis = client();
    if (!redis) return WriteResult::failure(CacheErrorKind::Connection, kClosed);
    try {
        return WriteResult::success(redis->del(key) > 0);
    } catch (const sw::redis::Error& e) {
        return WriteResult::failure(CacheErrorKind::Connection, e.what());
    }
}

WriteResult RedisCache::exists(const std::string& key) {
    auto redis = client();
    if (!redis) return WriteResult::failure(CacheErrorKind::Connection, kClosed);
    try {
        return WriteResult::success(redis->exists(key) > 0);
    } catch (const sw::redis::Error& e) {
        return WriteResult::failure(CacheErrorKind::Connection, e.what());
    }
}

WriteResult RedisCache::clear() {
    auto redis = client();
    if (!redis) return WriteResult::failure(CacheErrorKind::Connection, kClosed);

    const std::string pattern = redis_glob_escape(key_prefix_) + ":*";
    sw::redis::Cursor cursor = 0;
    try {
        do {
            std::vector<std::string> keys;
            cursor = redis->scan(cursor, pattern, 100, std::back_inserter(keys));
            if (!keys.empty()) redis->del(keys.begin(), keys.end());
        } while (cursor != 0);
    } catch (const sw::redis::Error& e) {
        return WriteResult::failure(CacheErrorKind::Connection, e.what());
    }
    return WriteResult::success(true);
}

// In-flight calls keep their own reference; the pool goes away with the last one.
void RedisCache::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    redis_.reset();
}

} // namespace epss
