#pragma once
#include "../cache.hpp"
#include "../config.hpp"
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace epss {

// One file per key under a directory. Freshness is the file's mtime plus
// the configured TTL; stale files stay on disk until size eviction removes
// them.
class FileCache : public Cache {
public:
    // Creates the directory and enforces the size budget once.
    // Throws std::invalid_argument for an unknown format and
    // std::runtime_error when the directory cannot be created.
    FileCache(const FileConfig& config, uint32_t ttl_seconds);

    std::string backend_name() const override { return "file"; }

    LookupResult get(const std::string& key) override;
    WriteResult set(const std::string& key, const nlohmann::json& value,
                    std::optional<uint32_t> ttl_seconds) override;
    WriteResult remove(const std::string& key) override;
    WriteResult clear() override;
    WriteResult exists(const std::string& key) override;
    void close() override {}

    // Path of the file backing `key`
    std::filesystem::path file_path_for(const std::string& key) const;

    // Total bytes of cache files in the directory
    uint64_t directory_size() const;

private:
    bool is_cache_file(const std::filesystem::path& path) const;
    bool is_expired(const std::filesystem::path& path) const;
    void enforce_size_limit();

    FileConfig config_;
    std::filesystem::path dir_;
    uint32_t ttl_seconds_;
    std::string extension_;
    std::mutex mutex_;
};

// gzip framing via zlib. nullopt on failure.
std::optional<std::string> gzip_compress(const std::string& data);
std::optional<std::string> gzip_decompress(const std::string& data);

} // namespace epss
