#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace epss {

// Derives `<prefix>:<operation>:<md5 of canonical params>:<date|current>`.
//
// `params` is a JSON object of scalar values. Null-valued entries are
// dropped before hashing, and the canonical form sorts keys, so insertion
// order never affects the result.
class CacheKeyGenerator {
public:
    explicit CacheKeyGenerator(std::string prefix = "epss");

    std::string generate_key(const std::string& operation,
                             const nlohmann::json& params) const;

    const std::string& prefix() const { return prefix_; }

private:
    std::string prefix_;
};

// Compact, key-sorted, ASCII-escaped JSON with nulls removed.
std::string canonical_params(const nlohmann::json& params);

// Lower-case hex MD5 digest
std::string md5_hex(const std::string& data);

} // namespace epss
