#include "file_cache.hpp"
#include "../util.hpp"
#include <zlib.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace epss {

namespace fs = std::filesystem;

static constexpr size_t kZlibChunk = 32768;

std::optional<std::string> gzip_compress(const std::string& data) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    // 15 | 16: deflate window with a gzip header
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 | 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char buffer[kZlibChunk];
    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        ret = deflate(&zs, Z_FINISH);
        out.append(buffer, sizeof(buffer) - zs.avail_out);
    } while (ret == Z_OK);

    deflateEnd(&zs);
    if (ret != Z_STREAM_END) return std::nullopt;
    return out;
}

std::optional<std::string> gzip_decompress(const std::string& data) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    // 15 | 32: detect zlib or gzip header
    if (inflateInit2(&zs, 15 | 32) != Z_OK) return std::nullopt;

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char buffer[kZlibChunk];
    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) break;
        out.append(buffer, sizeof(buffer) - zs.avail_out);
    } while (ret == Z_OK && (zs.avail_in > 0 || zs.avail_out == 0));

    inflateEnd(&zs);
    if (ret != Z_STREAM_END) return std::nullopt;
    return out;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

FileCache::FileCache(const FileConfig& config, uint32_t ttl_seconds)
    : config_(config), dir_(expand_home(config.directory)), ttl_seconds_(ttl_seconds) {
    if (config_.format == "json") {
        extension_ = ".json";
    } else if (config_.format == "cbor") {
        extension_ = ".cbor";
    } else {
        throw std::invalid_argument("FileCache: unsupported format: " + config_.format);
    }
    if (config_.compression) extension_ += ".gz";

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec || !fs::is_directory(dir_)) {
        throw std::runtime_error("FileCache: cannot create directory " + dir_.string() +
                                 (ec ? ": " + ec.message() : std::string{}));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    enforce_size_limit();
}

fs::path FileCache::file_path_for(const std::string& key) const {
    std::string safe = key;
    for (auto& c : safe) {
        if (c == '/' || c == '\\' || c == ':') c = '_';
    }
    return dir_ / (safe + extension_);
}

bool FileCache::is_cache_file(const fs::path& path) const {
    std::string name = path.filename().string();
    return ends_with(name, ".json") || ends_with(name, ".cbor") ||
           ends_with(name, ".json.gz") || ends_with(name, ".cbor.gz");
}

bool FileCache::is_expired(const fs::path& path) const {
    if (ttl_seconds_ == 0) return false;

    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) return true;

    auto age = fs::file_time_type::clock::now() - mtime;
    return age > std::chrono::seconds(ttl_seconds_);
}

LookupResult FileCache::get(const std::string& key) {
    fs::path path = file_path_for(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) return LookupResult::success(std::nullopt);

    // Stale entries are reported as misses but not deleted here.
    if (is_expired(path)) return LookupResult::success(std::nullopt);

    std::string raw;
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return LookupResult::failure(CacheErrorKind::Io, "cannot open " + path.string());
        }
        raw.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) {
            return LookupResult::failure(CacheErrorKind::Io, "cannot read " + path.string());
        }
    }

    auto discard = [&](const std::string& why) {
        fs::remove(path, ec);
        return LookupResult::failure(CacheErrorKind::Corrupt, why + ": " + path.string());
    };

    if (config_.compression) {
        auto inflated = gzip_decompress(raw);
        if (!inflated) return discard("bad gzip data");
        raw = std::move(*inflated);
    }

    try {
        nlohmann::json value;
        if (config_.format == "json") {
            value = nlohmann::json::parse(raw);
        } else {
            value = nlohmann::json::from_cbor(raw);
        }
        return LookupResult::success(std::optional<nlohmann::json>(std::move(value)));
    } catch (const nlohmann::json::exception& e) {
        return discard(std::string("undecodable entry (") + e.what() + ")");
    }
}

WriteResult FileCache::set(const std::string& key, const nlohmann::json& value,
                           std::optional<uint32_t> /*ttl_seconds*/) {
    std::string data;
    try {
        if (config_.format == "json") {
            data = value.dump();
        } else {
            std::vector<uint8_t> bytes = nlohmann::json::to_cbor(value);
            data.assign(bytes.begin(), bytes.end());
        }
    } catch (const nlohmann::json::exception& e) {
        return WriteResult::failure(CacheErrorKind::Serialization, e.what());
    }

    if (config_.compression) {
        auto deflated = gzip_compress(data);
        if (!deflated) {
            return WriteResult::failure(CacheErrorKind::Serialization, "gzip compression failed");
        }
        data = std::move(*deflated);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fs::path path = file_path_for(key);
    if (!atomic_write_file(path.string(), data)) {
        return WriteResult::failure(CacheErrorKind::Io, "cannot write " + path.string());
    }

    enforce_size_limit();
    return WriteResult::success(true);
}

WriteResult FileCache::remove(const std::string& key) {
    std::error_code ec;
    bool removed = fs::remove(file_path_for(key), ec);
    if (ec) return WriteResult::failure(CacheErrorKind::Io, ec.message());
    return WriteResult::success(removed);
}

WriteResult FileCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::vector<fs::path> victims;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && is_cache_file(it->path())) {
            victims.push_back(it->path());
        }
    }
    if (ec) return WriteResult::failure(CacheErrorKind::Io, ec.message());

    for (const auto& path : victims) {
        fs::remove(path, ec);
        if (ec) return WriteResult::failure(CacheErrorKind::Io, ec.message());
    }
    return WriteResult::success(true);
}

WriteResult FileCache::exists(const std::string& key) {
    fs::path path = file_path_for(key);
    std::error_code ec;
    bool present = fs::exists(path, ec);
    if (ec) return WriteResult::failure(CacheErrorKind::Io, ec.message());
    return WriteResult::success(present && !is_expired(path));
}

uint64_t FileCache::directory_size() const {
    uint64_t total = 0;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || !is_cache_file(it->path())) continue;
        auto size = it->file_size(entry_ec);
        if (!entry_ec) total += size;
    }
    return total;
}

void FileCache::enforce_size_limit() {
    // Must be called with mutex_ already held.
    if (config_.max_size_mb <= 0) return;

    const uint64_t budget = static_cast<uint64_t>(config_.max_size_mb) * 1024 * 1024;

    struct FileInfo {
        fs::path path;
        fs::file_time_type mtime;
        uint64_t size;
    };
    std::vector<FileInfo> files;
    uint64_t total = 0;

    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || !is_cache_file(it->path())) continue;
        auto size = it->file_size(entry_ec);
        if (entry_ec) continue;
        auto mtime = it->last_write_time(entry_ec);
        if (entry_ec) continue;
        files.push_back({it->path(), mtime, size});
        total += size;
    }

    if (total <= budget) return;

    std::sort(files.begin(), files.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.mtime < b.mtime; });

    for (const auto& f : files) {
        std::error_code rm_ec;
        if (!fs::remove(f.path, rm_ec) || rm_ec) {
            std::cerr << "[file_cache] Could not evict " << f.path.string() << "\n";
            continue;
        }
        total -= f.size;
        if (total <= budget) break;
    }
}

} // namespace epss
