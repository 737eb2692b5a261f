#include "config.hpp"
#include "util.hpp"

#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

namespace epss {

nlohmann::json CacheConfig::defaults_json() {
    CacheConfig defaults;
    return {{"cache", defaults.to_json()}};
}

nlohmann::json CacheConfig::to_json() const {
    return {
        {"enabled", enabled},
        {"backend", backend},
        {"ttl", ttl},
        {"key_prefix", key_prefix},
        {"redis", {
            {"host", redis.host},
            {"port", redis.port},
            {"db", redis.db},
            {"socket_timeout", redis.socket_timeout},
            {"socket_connect_timeout", redis.socket_connect_timeout},
            {"max_connections", redis.max_connections}
        }},
        {"database", {
            {"url", database.url},
            {"table_name", database.table_name},
            {"pool_size", database.pool_size},
            {"max_overflow", database.max_overflow},
            {"pool_timeout", database.pool_timeout}
        }},
        {"file", {
            {"directory", file.directory},
            {"max_size_mb", file.max_size_mb},
            {"compression", file.compression},
            {"format", file.format}
        }}
    };
}

CacheConfig CacheConfig::from_json(const nlohmann::json& root) {
    CacheConfig cfg;
    if (!root.is_object() || !root.contains("cache") || !root["cache"].is_object())
        return cfg;

    const auto& c = root["cache"];
    if (c.contains("enabled") && c["enabled"].is_boolean())
        cfg.enabled = c["enabled"].get<bool>();
    if (c.contains("backend") && c["backend"].is_string())
        cfg.backend = c["backend"].get<std::string>();
    if (c.contains("ttl") && c["ttl"].is_number_unsigned())
        cfg.ttl = c["ttl"].get<uint32_t>();
    if (c.contains("key_prefix") && c["key_prefix"].is_string())
        cfg.key_prefix = c["key_prefix"].get<std::string>();

    if (c.contains("redis") && c["redis"].is_object()) {
        const auto& r = c["redis"];
        if (r.contains("host") && r["host"].is_string())
            cfg.redis.host = r["host"].get<std::string>();
        if (r.contains("port") && r["port"].is_number_unsigned() &&
            r["port"].get<uint32_t>() <= 65535)
            cfg.redis.port = static_cast<uint16_t>(r["port"].get<uint32_t>());
        if (r.contains("db") && r["db"].is_number_unsigned())
            cfg.redis.db = r["db"].get<uint32_t>();
        if (r.contains("password") && r["password"].is_string())
            cfg.redis.password = r["password"].get<std::string>();
        if (r.contains("socket_timeout") && r["socket_timeout"].is_number())
            cfg.redis.socket_timeout = r["socket_timeout"].get<double>();
        if (r.contains("socket_connect_timeout") && r["socket_connect_timeout"].is_number())
            cfg.redis.socket_connect_timeout = r["socket_connect_timeout"].get<double>();
        if (r.contains("max_connections") && r["max_connections"].is_number_unsigned())
            cfg.redis.max_connections = r["max_connections"].get<uint32_t>();
    }

    if (c.contains("database") && c["database"].is_object()) {
        const auto& d = c["database"];
        if (d.contains("url") && d["url"].is_string())
            cfg.database.url = d["url"].get<std::string>();
        if (d.contains("table_name") && d["table_name"].is_string())
            cfg.database.table_name = d["table_name"].get<std::string>();
        if (d.contains("pool_size") && d["pool_size"].is_number_unsigned())
            cfg.database.pool_size = d["pool_size"].get<uint32_t>();
        if (d.contains("max_overflow") && d["max_overflow"].is_number_unsigned())
            cfg.database.max_overflow = d["max_overflow"].get<uint32_t>();
        if (d.contains("pool_timeout") && d["pool_timeout"].is_number_unsigned())
            cfg.database.pool_timeout = d["pool_timeout"].get<uint32_t>();
    }

    if (c.contains("file") && c["file"].is_object()) {
        const auto& f = c["file"];
        if (f.contains("directory") && f["directory"].is_string())
            cfg.file.directory = f["directory"].get<std::string>();
        if (f.contains("max_size_mb") && f["max_size_mb"].is_number_integer())
            cfg.file.max_size_mb = f["max_size_mb"].get<int64_t>();
        if (f.contains("compression") && f["compression"].is_boolean())
            cfg.file.compression = f["compression"].get<bool>();
        if (f.contains("format") && f["format"].is_string())
            cfg.file.format = f["format"].get<std::string>();
    }

    return cfg;
}

// Non-negative integers become unsigned so they pass the is_number_unsigned
// checks in from_json, matching what the JSON parser produces.
static nlohmann::json integer_json(long long v) {
    if (v >= 0) return static_cast<uint64_t>(v);
    return v;
}

// Plain scalars are typed the YAML 1.1 way (bool, int, float, else
// string); quoted scalars stay strings.
static nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) arr.push_back(yaml_to_json(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Scalar:
            break;
    }

    if (node.Tag() == "!") return node.Scalar();
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) return b;
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) return integer_json(i);
    double d = 0;
    if (YAML::convert<double>::decode(node, d)) return d;
    return node.Scalar();
}

// Dates and times are kept as their TOML text.
static nlohmann::json toml_to_json(const toml::node& node) {
    if (const auto* t = node.as_table()) {
        nlohmann::json obj = nlohmann::json::object();
        for (auto&& [key, value] : *t) obj[std::string(key.str())] = toml_to_json(value);
        return obj;
    }
    if (const auto* a = node.as_array()) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& value : *a) arr.push_back(toml_to_json(value));
        return arr;
    }
    if (const auto* v = node.as_string()) return v->get();
    if (const auto* v = node.as_integer()) return integer_json(v->get());
    if (const auto* v = node.as_floating_point()) return v->get();
    if (const auto* v = node.as_boolean()) return v->get();

    std::ostringstream text;
    if (const auto* v = node.as_date()) text << v->get();
    else if (const auto* v = node.as_time()) text << v->get();
    else if (const auto* v = node.as_date_time()) text << v->get();
    return text.str();
}

static nlohmann::json read_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + file_path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Malformed config file " + file_path.string() + ": " + e.what());
    }
}

static nlohmann::json read_yaml_file(const std::filesystem::path& file_path) {
    try {
        return yaml_to_json(YAML::LoadFile(file_path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed config file " + file_path.string() + ": " + e.what());
    }
}

// pyproject.toml keeps its settings under [tool.epss.cache]; a top-level
// [cache] table is accepted there as in any other TOML file.
static nlohmann::json read_toml_file(const std::filesystem::path& file_path) {
    toml::table doc;
    try {
        doc = toml::parse_file(file_path.string());
    } catch (const toml::parse_error& e) {
        throw ConfigError("Malformed config file " + file_path.string() + ": " + e.what());
    }

    if (file_path.filename() == "pyproject.toml") {
        if (const auto* tool = doc["tool"]["epss"]["cache"].as_table()) {
            return {{"cache", toml_to_json(*tool)}};
        }
    }
    return toml_to_json(doc);
}

CacheConfig CacheConfig::from_file(const std::string& path) {
    std::filesystem::path file_path(expand_home(path));

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        throw ConfigError("Config file not found: " + file_path.string());
    }

    std::string suffix = to_lower(file_path.extension().string());
    if (suffix == ".json") return from_json(read_json_file(file_path));
    if (suffix == ".yaml" || suffix == ".yml") return from_json(read_yaml_file(file_path));
    if (suffix == ".toml") return from_json(read_toml_file(file_path));
    throw ConfigError("Unsupported config file format: " + suffix);
}

// Values that are negative, carry trailing text or overflow T keep the
// current value.
template <typename T>
static void env_unsigned(const char* name, T& out) {
    const char* v = std::getenv(name);
    if (!v) return;

    std::string text = trim(v);
    bool valid = !text.empty() && text[0] != '-' && text[0] != '+';
    unsigned long long parsed = 0;
    if (valid) {
        try {
            size_t used = 0;
            parsed = std::stoull(text, &used);
            valid = used == text.size() && parsed <= std::numeric_limits<T>::max();
        } catch (const std::exception&) {
            valid = false;
        }
    }
    if (!valid) {
        std::cerr << "[config] Ignoring invalid " << name << "=" << v << "\n";
        return;
    }
    out = static_cast<T>(parsed);
}

CacheConfig CacheConfig::from_env() {
    CacheConfig cfg;

    if (const char* v = std::getenv("EPSS_CACHE_ENABLED"))
        cfg.enabled = to_lower(trim(v)) == "true";
    if (const char* v = std::getenv("EPSS_CACHE_BACKEND"))
        cfg.backend = v;
    env_unsigned("EPSS_CACHE_TTL", cfg.ttl);
    if (const char* v = std::getenv("EPSS_CACHE_KEY_PREFIX"))
        cfg.key_prefix = v;

    if (const char* v = std::getenv("EPSS_CACHE_REDIS_HOST"))
        cfg.redis.host = v;
    env_unsigned("EPSS_CACHE_REDIS_PORT", cfg.redis.port);
    env_unsigned("EPSS_CACHE_REDIS_DB", cfg.redis.db);
    if (const char* v = std::getenv("EPSS_CACHE_REDIS_PASSWORD"))
        cfg.redis.password = std::string(v);

    if (const char* v = std::getenv("EPSS_CACHE_DATABASE_URL"))
        cfg.database.url = v;
    if (const char* v = std::getenv("EPSS_CACHE_DATABASE_TABLE"))
        cfg.database.table_name = v;

    if (const char* v = std::getenv("EPSS_CACHE_FILE_DIRECTORY"))
        cfg.file.directory = v;
    if (const char* v = std::getenv("EPSS_CACHE_FILE_MAX_SIZE_MB")) {
        try {
            cfg.file.max_size_mb = std::stoll(v);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid EPSS_CACHE_FILE_MAX_SIZE_MB=" << v << "\n";
        }
    }

    return cfg;
}

CacheConfig CacheConfig::load(const std::optional<std::string>& config_file) {
    if (config_file) {
        try {
            return from_file(*config_file);
        } catch (const ConfigError& e) {
            std::cerr << "[config] " << e.what() << "; using environment\n";
        }
    } else {
        const std::vector<std::string> locations = {
            expand_home("~/.epss/config.yaml"),
            expand_home("~/.epss/config.yml"),
            expand_home("~/.epss/config.json"),
            "epss.yaml",
            "epss.yml",
            "epss.json",
            "pyproject.toml",
        };
        for (const auto& location : locations) {
            std::error_code ec;
            if (!std::filesystem::exists(location, ec)) continue;
            try {
                return from_file(location);
            } catch (const ConfigError& e) {
                std::cerr << "[config] " << e.what() << "\n";
            }
        }
    }

    return from_env();
}

} // namespace epss
