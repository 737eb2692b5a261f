#pragma once
#include "cache.hpp"
#include "cache_key.hpp"
#include "cache_stats.hpp"
#include "config.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace epss {

// Owns one backend, the key generator and the statistics.
//
// A manager is either active (enabled and the configured backend came up)
// or disabled. A disabled manager answers every lookup with a miss and
// every write with success, and never touches its statistics. Backend
// failures on an active manager are logged, counted as errors and folded
// into the same neutral answers, so callers never see an exception.
class CacheManager {
public:
    // Never throws. An unknown backend name or a backend that fails to
    // initialise leaves the manager disabled with one error recorded.
    explicit CacheManager(CacheConfig config = {});
    ~CacheManager();

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    std::optional<nlohmann::json> get(const std::string& operation,
                                      const nlohmann::json& params);

    // ttl overrides the configured default for this entry; nullopt or 0
    // uses the default.
    bool set(const std::string& operation, const nlohmann::json& value,
             const nlohmann::json& params,
             std::optional<uint32_t> ttl = std::nullopt);

    bool remove(const std::string& operation, const nlohmann::json& params);
    bool exists(const std::string& operation, const nlohmann::json& params);

    // Resets statistics when the backend reports success.
    bool clear();

    // Closes the backend. Safe to call more than once; statistics are kept.
    void close();

    // hits, misses, sets, deletes, errors, hit_rate, uptime, enabled,
    // backend, ttl
    nlohmann::json stats() const;

    std::string cache_key(const std::string& operation, const nlohmann::json& params) const;

    bool is_active() const { return active_; }
    const CacheConfig& config() const { return config_; }
    std::string backend_name() const;

private:
    void record_error(const std::string& op, const std::string& message);

    CacheConfig config_;
    CacheKeyGenerator keys_;
    std::unique_ptr<Cache> backend_;
    bool active_ = false;
    bool closed_ = false;

    mutable std::mutex mutex_;
    CacheStats stats_;
};

// Load settings (explicit path, default locations, environment) and build
// a manager. Never throws.
std::unique_ptr<CacheManager> create_cache_manager(
    const std::optional<std::string>& config_path = std::nullopt);

} // namespace epss
