#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace epss {

struct CacheConfig; // forward declaration

enum class CacheErrorKind { Io, Corrupt, Serialization, Connection, Protocol, Database };

struct CacheError {
    CacheErrorKind kind = CacheErrorKind::Io;
    std::string message;
};

// Outcome of a backend operation: either a value or an error.
// Backends never throw from their operations; the manager maps every
// error to a miss / false.
template <typename T>
class CacheResult {
public:
    static CacheResult success(T value) {
        CacheResult r;
        r.value_ = std::move(value);
        return r;
    }

    static CacheResult failure(CacheErrorKind kind, std::string message) {
        CacheResult r;
        r.error_ = CacheError{kind, std::move(message)};
        return r;
    }

    bool ok() const { return !error_.has_value(); }

    // Only valid when ok()
    const T& value() const { return *value_; }
    T& value() { return *value_; }

    // Only valid when !ok()
    const CacheError& error() const { return *error_; }

    T value_or(T fallback) const { return ok() ? *value_ : std::move(fallback); }

private:
    CacheResult() = default;

    std::optional<T> value_;
    std::optional<CacheError> error_;
};

// get(): absent optional on a clean miss
using LookupResult = CacheResult<std::optional<nlohmann::json>>;
// set/remove/clear/exists
using WriteResult = CacheResult<bool>;

// Abstract cache backend interface
class Cache {
public:
    virtual ~Cache() = default;

    virtual std::string backend_name() const = 0;

    // Look up a value. A miss is ok() with an empty optional.
    virtual LookupResult get(const std::string& key) = 0;

    // Store a value; nullopt ttl means no expiry.
    virtual WriteResult set(const std::string& key,
                            const nlohmann::json& value,
                            std::optional<uint32_t> ttl_seconds) = 0;

    // Delete one entry. Value is true if something was removed.
    virtual WriteResult remove(const std::string& key) = 0;

    // Remove every entry owned by this backend.
    virtual WriteResult clear() = 0;

    virtual WriteResult exists(const std::string& key) = 0;

    // Release held resources. Safe to call more than once.
    virtual void close() = 0;
};

enum class CacheBackendKind { File, Redis, Database };

std::string error_kind_to_string(CacheErrorKind kind);

// Parse the configured backend name. nullopt for unknown names.
std::optional<CacheBackendKind> backend_kind_from_string(const std::string& name);
std::string backend_kind_to_string(CacheBackendKind kind);

// Construct the backend selected by config.backend.
// Throws std::invalid_argument for an unknown backend name, and whatever
// the backend constructor throws when it cannot initialise.
std::unique_ptr<Cache> create_cache(const CacheConfig& config);

} // namespace epss
