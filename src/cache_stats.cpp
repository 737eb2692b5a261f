#include "cache_stats.hpp"

namespace epss {

CacheStats::CacheStats() : start_(std::chrono::steady_clock::now()) {}

double CacheStats::hit_rate() const {
    uint64_t total = hits_ + misses_;
    if (total == 0) return 0.0;
    return static_cast<double>(hits_) / static_cast<double>(total);
}

double CacheStats::uptime() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    return elapsed.count();
}

nlohmann::json CacheStats::to_json() const {
    return {
        {"hits", hits_},
        {"misses", misses_},
        {"sets", sets_},
        {"deletes", deletes_},
        {"errors", errors_},
        {"hit_rate", hit_rate()},
        {"uptime", uptime()}
    };
}

} // namespace epss
