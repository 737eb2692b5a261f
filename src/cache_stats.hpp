#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>

namespace epss {

// Per-manager operation counters. Not thread-safe on its own; the
// CacheManager serialises access.
class CacheStats {
public:
    CacheStats();

    void record_hit()    { ++hits_; }
    void record_miss()   { ++misses_; }
    void record_set()    { ++sets_; }
    void record_delete() { ++deletes_; }
    void record_error()  { ++errors_; }

    uint64_t hits() const    { return hits_; }
    uint64_t misses() const  { return misses_; }
    uint64_t sets() const    { return sets_; }
    uint64_t deletes() const { return deletes_; }
    uint64_t errors() const  { return errors_; }

    // hits / (hits + misses), 0 before any lookup
    double hit_rate() const;

    // Seconds since construction
    double uptime() const;

    nlohmann::json to_json() const;

private:
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t sets_ = 0;
    uint64_t deletes_ = 0;
    uint64_t errors_ = 0;
    std::chrono::steady_clock::time_point start_;
};

} // namespace epss
