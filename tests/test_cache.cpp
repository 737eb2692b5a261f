#include <catch2/catch_test_macros.hpp>
#include "cache.hpp"
#include "config.hpp"
#include "cache/none_cache.hpp"
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

using namespace epss;

// ── CacheResult ──────────────────────────────────────────────────

TEST_CASE("CacheResult: success carries a value", "[cache]") {
    auto r = WriteResult::success(true);
    REQUIRE(r.ok());
    REQUIRE(r.value());
}

TEST_CASE("CacheResult: failure carries kind and message", "[cache]") {
    auto r = LookupResult::failure(CacheErrorKind::Corrupt, "bad bytes");
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error().kind == CacheErrorKind::Corrupt);
    REQUIRE(r.error().message == "bad bytes");
    REQUIRE_FALSE(r.value_or(std::nullopt).has_value());
}

TEST_CASE("error_kind_to_string: every kind", "[cache]") {
    REQUIRE(error_kind_to_string(CacheErrorKind::Io) == "io");
    REQUIRE(error_kind_to_string(CacheErrorKind::Corrupt) == "corrupt");
    REQUIRE(error_kind_to_string(CacheErrorKind::Serialization) == "serialization");
    REQUIRE(error_kind_to_string(CacheErrorKind::Connection) == "connection");
    REQUIRE(error_kind_to_string(CacheErrorKind::Protocol) == "protocol");
    REQUIRE(error_kind_to_string(CacheErrorKind::Database) == "database");
}

// ── Backend kinds ────────────────────────────────────────────────

TEST_CASE("backend_kind_from_string: known and unknown", "[cache]") {
    REQUIRE(backend_kind_from_string("file") == CacheBackendKind::File);
    REQUIRE(backend_kind_from_string("redis") == CacheBackendKind::Redis);
    REQUIRE(backend_kind_from_string("database") == CacheBackendKind::Database);
    REQUIRE_FALSE(backend_kind_from_string("memcached").has_value());
    REQUIRE_FALSE(backend_kind_from_string("").has_value());
}

TEST_CASE("backend_kind_to_string: round trip", "[cache]") {
    for (auto kind : {CacheBackendKind::File, CacheBackendKind::Redis, CacheBackendKind::Database}) {
        REQUIRE(backend_kind_from_string(backend_kind_to_string(kind)) == kind);
    }
}

// ── create_cache ─────────────────────────────────────────────────

TEST_CASE("create_cache: unknown backend throws", "[cache]") {
    CacheConfig cfg;
    cfg.backend = "memcached";
    REQUIRE_THROWS_AS(create_cache(cfg), std::invalid_argument);
}

TEST_CASE("create_cache: file backend", "[cache]") {
    CacheConfig cfg;
    cfg.backend = "file";
    cfg.file.directory = "/tmp/epss_test_create_cache_" + std::to_string(getpid());
    auto cache = create_cache(cfg);
    REQUIRE(cache != nullptr);
    REQUIRE(cache->backend_name() == "file");
    cache->close();
    std::filesystem::remove_all(cfg.file.directory);
}

TEST_CASE("create_cache: in-memory database backend", "[cache]") {
    CacheConfig cfg;
    cfg.backend = "database";
    cfg.database.url = "sqlite:///:memory:";
    auto cache = create_cache(cfg);
    REQUIRE(cache->backend_name() == "database");
}

TEST_CASE("create_cache: unsupported database URL throws", "[cache]") {
    CacheConfig cfg;
    cfg.backend = "database";
    cfg.database.url = "postgresql://localhost/epss";
    REQUIRE_THROWS_AS(create_cache(cfg), std::invalid_argument);
}

// ── NoneCache ────────────────────────────────────────────────────

TEST_CASE("NoneCache: inert answers", "[cache]") {
    NoneCache cache;
    REQUIRE(cache.backend_name() == "none");

    auto set = cache.set("k", {{"a", 1}}, 60u);
    REQUIRE(set.ok());
    REQUIRE(set.value());

    auto got = cache.get("k");
    REQUIRE(got.ok());
    REQUIRE_FALSE(got.value().has_value());

    REQUIRE(cache.exists("k").ok());
    REQUIRE_FALSE(cache.exists("k").value());
    REQUIRE(cache.remove("k").value());
    REQUIRE(cache.clear().value());
    cache.close();
    cache.close();
}
