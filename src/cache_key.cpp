#include "cache_key.hpp"
#include <openssl/evp.h>
#include <cstdio>
#include <memory>
#include <stdexcept>

namespace epss {

CacheKeyGenerator::CacheKeyGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

std::string canonical_params(const nlohmann::json& params) {
    // nlohmann::json objects are std::map-backed, so dump() is key-sorted.
    nlohmann::json clean = nlohmann::json::object();
    if (params.is_object()) {
        for (auto it = params.begin(); it != params.end(); ++it) {
            if (it.value().is_null()) continue;
            clean[it.key()] = it.value();
        }
    }
    return clean.dump(-1, ' ', true);
}

std::string md5_hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw std::runtime_error("md5_hex: digest failed");
    }

    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        out += buf;
    }
    return out;
}

std::string CacheKeyGenerator::generate_key(const std::string& operation,
                                            const nlohmann::json& params) const {
    std::string param_hash = md5_hex(canonical_params(params));

    std::string date_suffix = "current";
    if (params.is_object()) {
        auto it = params.find("date");
        if (it != params.end() && !it->is_null()) {
            date_suffix = it->is_string() ? it->get<std::string>() : it->dump();
        }
    }

    return prefix_ + ":" + operation + ":" + param_hash + ":" + date_suffix;
}

} // namespace epss
