#pragma once
#include "../cache.hpp"

namespace epss {

// Inert backend installed when caching is disabled or a real backend
// failed to initialise.
class NoneCache : public Cache {
public:
    std::string backend_name() const override { return "none"; }

    LookupResult get(const std::string&) override {
        return LookupResult::success(std::nullopt);
    }

    WriteResult set(const std::string&, const nlohmann::json&,
                    std::optional<uint32_t>) override {
        return WriteResult::success(true);
    }

    WriteResult remove(const std::string&) override { return WriteResult::success(true); }

    WriteResult clear() override { return WriteResult::success(true); }

    WriteResult exists(const std::string&) override { return WriteResult::success(false); }

    void close() override {}
};

} // namespace epss
