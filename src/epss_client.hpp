#pragma once
#include "http.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace epss {

class CacheManager; // forward declaration

// Raised for a non-2xx status, a transport failure (status_code 0) or a
// body that is not JSON. Failed lookups are never cached.
class EpssError : public std::runtime_error {
public:
    EpssError(const std::string& message, long status_code)
        : std::runtime_error(message), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

struct EpssClientConfig {
    std::string base_url = "https://api.first.org/data/v1/epss";
    long timeout_seconds = 30;
    std::string user_agent = "epss/0.1.0 (+https://api.first.org/epss)";
};

// Lookup parameters. Unset fields are left off the request.
struct QueryParams {
    std::vector<std::string> cves;
    std::optional<std::string> date;      // YYYY-MM-DD
    std::optional<std::string> scope;     // "time-series"
    std::optional<std::string> order;     // e.g. "!epss"
    std::optional<double> epss_gt;
    std::optional<double> percentile_gt;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    bool envelope = false;
    bool pretty = false;
    nlohmann::json extra = nlohmann::json::object(); // passed through; nulls skipped
};

// Wire parameter object: cve, date, scope, order, epss-gt, percentile-gt,
// limit, offset, envelope, pretty, plus extras.
nlohmann::json build_query_params(const QueryParams& params);

// "k=v&k=v" in key order, percent-encoded.
std::string build_query_string(const nlohmann::json& params);

// Client for the FIRST EPSS API. When a cache manager is supplied every
// lookup is served from it when possible and stored after a successful
// fetch. The manager must outlive the client.
class EpssClient {
public:
    EpssClient(HttpClient& http, EpssClientConfig config = {}, CacheManager* cache = nullptr);

    nlohmann::json query(const QueryParams& params, bool use_cache = true,
                         std::optional<uint32_t> cache_ttl = std::nullopt);

    // Single CVE. cves in `options` is replaced.
    nlohmann::json get(const std::string& cve, QueryParams options = {},
                       bool use_cache = true,
                       std::optional<uint32_t> cache_ttl = std::nullopt);

    nlohmann::json batch(const std::vector<std::string>& cves, QueryParams options = {},
                         bool use_cache = true,
                         std::optional<uint32_t> cache_ttl = std::nullopt);

    // Highest scores first by default.
    nlohmann::json top(int64_t limit = 100, const std::string& order = "!epss",
                       QueryParams options = {}, bool use_cache = true,
                       std::optional<uint32_t> cache_ttl = std::nullopt);

    // Manager statistics; nullopt without a manager.
    std::optional<nlohmann::json> cache_stats() const;

    // false without a manager.
    bool clear_cache();

    const EpssClientConfig& config() const { return config_; }

private:
    nlohmann::json fetch(const std::string& operation, const nlohmann::json& wire_params,
                         bool use_cache, std::optional<uint32_t> cache_ttl);

    HttpClient& http_;
    EpssClientConfig config_;
    CacheManager* cache_;
};

} // namespace epss
