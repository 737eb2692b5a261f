#include "cache_manager.hpp"
#include "cache/none_cache.hpp"
#include <iostream>
#include <stdexcept>

namespace epss {

CacheManager::CacheManager(CacheConfig config)
    : config_(std::move(config)), keys_(config_.key_prefix) {
    if (!config_.enabled) {
        backend_ = std::make_unique<NoneCache>();
        return;
    }

    try {
        backend_ = create_cache(config_);
        active_ = true;
        std::cerr << "[cache] " << backend_->backend_name()
                  << " backend ready (ttl " << config_.ttl << "s)\n";
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failed to initialise " << config_.backend
                  << " backend: " << e.what() << "; caching disabled\n";
        backend_ = std::make_unique<NoneCache>();
        stats_.record_error();
    }
}

CacheManager::~CacheManager() {
    close();
}

void CacheManager::record_error(const std::string& op, const std::string& message) {
    std::cerr << "[cache] " << op << " failed: " << message << "\n";
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.record_error();
}

std::string CacheManager::cache_key(const std::string& operation,
                                    const nlohmann::json& params) const {
    return keys_.generate_key(operation, params);
}

std::string CacheManager::backend_name() const {
    return backend_->backend_name();
}

std::optional<nlohmann::json> CacheManager::get(const std::string& operation,
                                                const nlohmann::json& params) {
    if (!active_) return std::nullopt;

    LookupResult result = LookupResult::success(std::nullopt);
    try {
        result = backend_->get(cache_key(operation, params));
    } catch (const std::exception& e) {
        result = LookupResult::failure(CacheErrorKind::Io, e.what());
    }

    if (!result.ok()) {
        record_error("get",
                     error_kind_to_string(result.error().kind) + ": " + result.error().message);
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.record_miss();
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (result.value()) {
        stats_.record_hit();
    } else {
        stats_.record_miss();
    }
    return result.value();
}

bool CacheManager::set(const std::string& operation, const nlohmann::json& value,
                       const nlohmann::json& params, std::optional<uint32_t> ttl) {
    if (!active_) return true;

    // A resolved ttl of 0 means the entry never expires.
    std::optional<uint32_t> effective_ttl = (ttl && *ttl > 0) ? *ttl : config_.ttl;
    if (*effective_ttl == 0) effective_ttl = std::nullopt;

    WriteResult result = WriteResult::success(false);
    try {
        result = backend_->set(cache_key(operation, params), value, effective_ttl);
    } catch (const std::exception& e) {
        result = WriteResult::failure(CacheErrorKind::Io, e.what());
    }

    if (!result.ok()) {
        record_error("set",
                     error_kind_to_string(result.error().kind) + ": " + result.error().message);
        return false;
    }
    if (result.value()) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.record_set();
    }
    return result.value();
}

bool CacheManager::remove(const std::string& operation, const nlohmann::json& params) {
    if (!active_) return true;

    WriteResult result = WriteResult::success(false);
    try {
        result = backend_->remove(cache_key(operation, params));
    } catch (const std::exception& e) {
        result = WriteResult::failure(CacheErrorKind::Io, e.what());
    }

    if (!result.ok()) {
        record_error("delete",
                     error_kind_to_string(result.error().kind) + ": " + result.error().message);
        return false;
    }
    if (result.value()) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.record_delete();
    }
    return result.value();
}

bool CacheManager::exists(const std::string& operation, const nlohmann::json& params) {
    if (!active_) return false;

    WriteResult result = WriteResult::success(false);
    try {
        result = backend_->exists(cache_key(operation, params));
    } catch (const std::exception& e) {
        result = WriteResult::failure(CacheErrorKind::Io, e.what());
    }

    if (!result.ok()) {
        record_error("exists",
                     error_kind_to_string(result.error().kind) + ": " + result.error().message);
        return false;
    }
    return result.value();
}

bool CacheManager::clear() {
    if (!active_) return true;

    WriteResult result = WriteResult::success(false);
    try {
        result = backend_->clear();
    } catch (const std::exception& e) {
        result = WriteResult::failure(CacheErrorKind::Io, e.what());
    }

    if (!result.ok()) {
        record_error("clear",
                     error_kind_to_string(result.error().kind) + ": " + result.error().message);
        return false;
    }
    if (result.value()) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_ = CacheStats();
    }
    return result.value();
}

void CacheManager::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
    }
    try {
        backend_->close();
    } catch (const std::exception& e) {
        std::cerr << "[cache] close failed: " << e.what() << "\n";
    }
}

nlohmann::json CacheManager::stats() const {
    nlohmann::json j;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        j = stats_.to_json();
    }
    j["enabled"] = active_;
    j["backend"] = backend_->backend_name();
    j["ttl"] = config_.ttl;
    return j;
}

std::unique_ptr<CacheManager> create_cache_manager(const std::optional<std::string>& config_path) {
    CacheConfig config;
    try {
        config = CacheConfig::load(config_path);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Failed to load settings: " << e.what() << "; caching disabled\n";
        config = CacheConfig();
        config.enabled = false;
    }
    return std::make_unique<CacheManager>(std::move(config));
}

} // namespace epss
