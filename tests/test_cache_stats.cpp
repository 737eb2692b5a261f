#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "cache_stats.hpp"
#include <chrono>
#include <thread>

using namespace epss;
using Catch::Matchers::WithinAbs;

TEST_CASE("CacheStats: starts at zero", "[cache_stats]") {
    CacheStats s;
    REQUIRE(s.hits() == 0);
    REQUIRE(s.misses() == 0);
    REQUIRE(s.sets() == 0);
    REQUIRE(s.deletes() == 0);
    REQUIRE(s.errors() == 0);
    REQUIRE(s.hit_rate() == 0.0);
}

TEST_CASE("CacheStats: hit rate over lookups only", "[cache_stats]") {
    CacheStats s;
    s.record_hit();
    s.record_hit();
    s.record_hit();
    s.record_miss();
    s.record_set();
    s.record_error();
    REQUIRE_THAT(s.hit_rate(), WithinAbs(0.75, 1e-9));
}

TEST_CASE("CacheStats: uptime grows", "[cache_stats]") {
    CacheStats s;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    REQUIRE(s.uptime() > 0.0);
}

TEST_CASE("CacheStats: to_json has every counter", "[cache_stats]") {
    CacheStats s;
    s.record_hit();
    s.record_delete();
    auto j = s.to_json();
    REQUIRE(j["hits"] == 1);
    REQUIRE(j["misses"] == 0);
    REQUIRE(j["sets"] == 0);
    REQUIRE(j["deletes"] == 1);
    REQUIRE(j["errors"] == 0);
    REQUIRE(j["hit_rate"].get<double>() == 1.0);
    REQUIRE(j.contains("uptime"));
}
