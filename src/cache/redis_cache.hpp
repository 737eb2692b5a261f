#pragma once
#include "../cache.hpp"
#include "../config.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace sw {
namespace redis {
class Redis;
} // namespace redis
} // namespace sw

namespace epss {

// Redis backend on redis-plus-plus. Values are stored as JSON text and
// expire through the server's native TTL (SETEX). The client keeps a pool
// of up to max_connections connections.
class RedisCache : public Cache {
public:
    // Connects, authenticates, selects the database and PINGs.
    // Throws std::runtime_error if any of that fails.
    RedisCache(const RedisConfig& config, std::string key_prefix);
    ~RedisCache() override;

    RedisCache(const RedisCache&) = delete;
    RedisCache& operator=(const RedisCache&) = delete;

    std::string backend_name() const override { return "redis"; }

    LookupResult get(const std::string& key) override;
    WriteResult set(const std::string& key, const nlohmann::json& value,
                    std::optional<uint32_t> ttl_seconds) override;
    WriteResult remove(const std::string& key) override;
    // Removes only keys under "<key_prefix>:"; other data in the database
    // is left alone.
    WriteResult clear() override;
    WriteResult exists(const std::string& key) override;
    void close() override;

private:
    // Current client, or nullptr once closed.
    std::shared_ptr<sw::redis::Redis> client() const;

    RedisConfig config_;
    std::string key_prefix_;

    mutable std::mutex mutex_;
    std::shared_ptr<sw::redis::Redis> redis_;
};

// Escape glob metacharacters for use in a SCAN MATCH pattern.
std::string redis_glob_escape(const std::string& s);

} // namespace epss
