#include "epss_client.hpp"
#include "cache_manager.hpp"
#include "util.hpp"

namespace epss {

nlohmann::json build_query_params(const QueryParams& params) {
    nlohmann::json wire = nlohmann::json::object();

    if (!params.cves.empty()) wire["cve"] = join(params.cves, ",");
    if (params.date && !params.date->empty()) wire["date"] = *params.date;
    if (params.scope && !params.scope->empty()) wire["scope"] = *params.scope;
    if (params.order && !params.order->empty()) wire["order"] = *params.order;
    if (params.epss_gt) wire["epss-gt"] = *params.epss_gt;
    if (params.percentile_gt) wire["percentile-gt"] = *params.percentile_gt;
    if (params.limit) wire["limit"] = *params.limit;
    if (params.offset) wire["offset"] = *params.offset;
    if (params.envelope) wire["envelope"] = "true";
    if (params.pretty) wire["pretty"] = "true";

    if (params.extra.is_object()) {
        for (auto it = params.extra.begin(); it != params.extra.end(); ++it) {
            if (!it.value().is_null()) wire[it.key()] = it.value();
        }
    }
    return wire;
}

std::string build_query_string(const nlohmann::json& params) {
    std::vector<std::string> parts;
    for (auto it = params.begin(); it != params.end(); ++it) {
        const auto& v = it.value();
        std::string value = v.is_string() ? v.get<std::string>() : v.dump();
        parts.push_back(url_encode(it.key()) + "=" + url_encode(value));
    }
    return join(parts, "&");
}

EpssClient::EpssClient(HttpClient& http, EpssClientConfig config, CacheManager* cache)
    : http_(http), config_(std::move(config)), cache_(cache) {}

nlohmann::json EpssClient::fetch(const std::string& operation,
                                 const nlohmann::json& wire_params,
                                 bool use_cache, std::optional<uint32_t> cache_ttl) {
    bool cached = use_cache && cache_ != nullptr;
    if (cached) {
        auto hit = cache_->get(operation, wire_params);
        if (hit) return *hit;
    }

    std::string url = config_.base_url;
    std::string qs = build_query_string(wire_params);
    if (!qs.empty()) url += (url.find('?') == std::string::npos ? "?" : "&") + qs;

    std::vector<Header> headers = {
        {"User-Agent", config_.user_agent},
        {"Accept", "application/json"},
    };

    HttpResponse response = http_.get(url, headers, config_.timeout_seconds);
    if (response.status_code == 0) {
        throw EpssError("EPSS request failed: no response from " + config_.base_url, 0);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw EpssError("EPSS API error (HTTP " + std::to_string(response.status_code) +
                        "): " + response.body, response.status_code);
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error&) {
        throw EpssError("EPSS API returned invalid JSON", response.status_code);
    }

    if (cached) cache_->set(operation, body, wire_params, cache_ttl);
    return body;
}

nlohmann::json EpssClient::query(const QueryParams& params, bool use_cache,
                                 std::optional<uint32_t> cache_ttl) {
    return fetch("query", build_query_params(params), use_cache, cache_ttl);
}

nlohmann::json EpssClient::get(const std::string& cve, QueryParams options,
                               bool use_cache, std::optional<uint32_t> cache_ttl) {
    options.cves = {cve};
    return fetch("get", build_query_params(options), use_cache, cache_ttl);
}

nlohmann::json EpssClient::batch(const std::vector<std::string>& cves, QueryParams options,
                                 bool use_cache, std::optional<uint32_t> cache_ttl) {
    options.cves = cves;
    return fetch("batch", build_query_params(options), use_cache, cache_ttl);
}

nlohmann::json EpssClient::top(int64_t limit, const std::string& order, QueryParams options,
                               bool use_cache, std::optional<uint32_t> cache_ttl) {
    options.limit = limit;
    options.order = order;
    return fetch("top", build_query_params(options), use_cache, cache_ttl);
}

std::optional<nlohmann::json> EpssClient::cache_stats() const {
    if (!cache_) return std::nullopt;
    return std::optional<nlohmann::json>(cache_->stats());
}

bool EpssClient::clear_cache() {
    if (!cache_) return false;
    return cache_->clear();
}

} // namespace epss
