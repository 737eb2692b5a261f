#include "cli.hpp"
#include "cache.hpp"
#include "cache_manager.hpp"
#include "config.hpp"
#include <memory>
#include <set>

namespace epss {

void print_usage(std::ostream& out) {
    out << "Usage: epss <command> [options]\n"
        << "\n"
        << "Commands:\n"
        << "  query                Generic query\n"
        << "  get CVE              Get a single CVE\n"
        << "  batch CVE...         Batch CVEs\n"
        << "  top                  Top N CVEs by EPSS score (--limit 100, --order !epss)\n"
        << "  cache stats          Show cache statistics\n"
        << "  cache clear          Clear cache\n"
        << "  cache config         Show cache configuration\n"
        << "\n"
        << "Options:\n"
        << "  --date YYYY-MM-DD    Scores as of a past date\n"
        << "  --scope time-series  Include the 30-day time series\n"
        << "  --order ORDER        Sorting order, e.g. !epss\n"
        << "  --epss-gt X          Filter: epss greater than X\n"
        << "  --percentile-gt X    Filter: percentile greater than X\n"
        << "  --limit N            Maximum rows\n"
        << "  --offset N           Rows to skip\n"
        << "  --envelope           Wrap results in the API envelope\n"
        << "  --pretty             Ask the API to pretty-print\n"
        << "  --format json|csv    Output format (default: json)\n"
        << "  -h, --help           Show this help\n"
        << "\n"
        << "Cache options:\n"
        << "  --cache-config PATH  Cache settings file (.json)\n"
        << "  --cache-backend NAME file, redis or database (enables the cache)\n"
        << "  --cache-ttl N        Cache TTL in seconds (enables the cache)\n"
        << "  --no-cache           Disable caching for this request\n"
        << "\n"
        << "Environment variables:\n"
        << "  EPSS_CACHE_ENABLED, EPSS_CACHE_BACKEND, EPSS_CACHE_TTL, EPSS_CACHE_KEY_PREFIX\n"
        << "  EPSS_CACHE_REDIS_HOST, EPSS_CACHE_REDIS_PORT, EPSS_CACHE_REDIS_DB,\n"
        << "  EPSS_CACHE_REDIS_PASSWORD, EPSS_CACHE_DATABASE_URL, EPSS_CACHE_DATABASE_TABLE,\n"
        << "  EPSS_CACHE_FILE_DIRECTORY, EPSS_CACHE_FILE_MAX_SIZE_MB\n";
}

// ── Argument parsing ──────────────────────────────────────────

static const std::string& take_value(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        throw UsageError("Option " + args[i] + " requires a value");
    }
    return args[++i];
}

static int64_t parse_integer(const std::string& opt, const std::string& value) {
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(value, &used);
    } catch (const std::logic_error&) {
        throw UsageError("Invalid integer for " + opt + ": " + value);
    }
    if (used != value.size()) throw UsageError("Invalid integer for " + opt + ": " + value);
    return v;
}

static double parse_number(const std::string& opt, const std::string& value) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::logic_error&) {
        throw UsageError("Invalid number for " + opt + ": " + value);
    }
    if (used != value.size()) throw UsageError("Invalid number for " + opt + ": " + value);
    return v;
}

CliOptions parse_cli(const std::vector<std::string>& args) {
    CliOptions opts;
    size_t i = 0;

    if (args.empty()) throw UsageError("Missing command");
    if (args[0] == "-h" || args[0] == "--help") {
        opts.help = true;
        return opts;
    }

    opts.command = args[i++];
    if (opts.command != "query" && opts.command != "get" && opts.command != "batch" &&
        opts.command != "top" && opts.command != "cache") {
        throw UsageError("Unknown command: " + opts.command);
    }

    if (opts.command == "cache") {
        if (i >= args.size()) throw UsageError("Missing cache command (stats, clear, config)");
        opts.cache_command = args[i++];
        if (opts.cache_command != "stats" && opts.cache_command != "clear" &&
            opts.cache_command != "config") {
            throw UsageError("Unknown cache command: " + opts.cache_command);
        }
    }

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--date") {
            opts.query.date = take_value(args, i);
        } else if (arg == "--scope") {
            const auto& v = take_value(args, i);
            if (v != "time-series") throw UsageError("Invalid --scope: " + v);
            opts.query.scope = v;
        } else if (arg == "--order") {
            opts.query.order = take_value(args, i);
        } else if (arg == "--epss-gt") {
            opts.query.epss_gt = parse_number(arg, take_value(args, i));
        } else if (arg == "--percentile-gt") {
            opts.query.percentile_gt = parse_number(arg, take_value(args, i));
        } else if (arg == "--limit") {
            opts.query.limit = parse_integer(arg, take_value(args, i));
        } else if (arg == "--offset") {
            opts.query.offset = parse_integer(arg, take_value(args, i));
        } else if (arg == "--envelope") {
            opts.query.envelope = true;
        } else if (arg == "--pretty") {
            opts.query.pretty = true;
        } else if (arg == "--format") {
            const auto& v = take_value(args, i);
            if (v != "json" && v != "csv") throw UsageError("Invalid --format: " + v);
            opts.format = v;
        } else if (arg == "--cache-config") {
            opts.cache_config = take_value(args, i);
        } else if (arg == "--cache-backend") {
            const auto& v = take_value(args, i);
            if (!backend_kind_from_string(v)) throw UsageError("Invalid --cache-backend: " + v);
            opts.cache_backend = v;
        } else if (arg == "--cache-ttl") {
            int64_t ttl = parse_integer(arg, take_value(args, i));
            if (ttl < 0 || ttl > UINT32_MAX) throw UsageError("Invalid --cache-ttl");
            opts.cache_ttl = static_cast<uint32_t>(ttl);
        } else if (arg == "--no-cache") {
            opts.no_cache = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        } else {
            opts.positional.push_back(arg);
        }
    }

    if (opts.help) return opts;

    if (opts.command == "get" && opts.positional.size() != 1) {
        throw UsageError("get takes exactly one CVE");
    }
    if (opts.command == "batch" && opts.positional.empty()) {
        throw UsageError("batch takes at least one CVE");
    }
    if ((opts.command == "query" || opts.command == "top" || opts.command == "cache") &&
        !opts.positional.empty()) {
        throw UsageError("Unexpected argument: " + opts.positional.front());
    }
    return opts;
}

// ── Output ────────────────────────────────────────────────────

static std::string csv_cell(const nlohmann::json& v) {
    std::string s;
    if (v.is_null()) return s;
    s = v.is_string() ? v.get<std::string>() : v.dump();
    if (s.find_first_of(",\"\r\n") == std::string::npos) return s;

    std::string quoted = "\"";
    for (char c : s) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void write_csv(const nlohmann::json& rows, std::ostream& out) {
    if (!rows.is_array() || rows.empty()) return;

    std::set<std::string> columns;
    for (const auto& row : rows) {
        if (!row.is_object()) continue;
        for (auto it = row.begin(); it != row.end(); ++it) columns.insert(it.key());
    }

    bool first = true;
    for (const auto& col : columns) {
        if (!first) out << ',';
        out << csv_cell(col);
        first = false;
    }
    out << "\r\n";

    for (const auto& row : rows) {
        if (!row.is_object()) continue;
        first = true;
        for (const auto& col : columns) {
            if (!first) out << ',';
            if (row.contains(col)) out << csv_cell(row[col]);
            first = false;
        }
        out << "\r\n";
    }
}

void print_output(const nlohmann::json& obj, const std::string& format, std::ostream& out) {
    if (format == "csv") {
        if (obj.is_object() && obj.contains("data")) write_csv(obj["data"], out);
        return;
    }
    out << obj.dump(2) << "\n";
}

// ── Commands ──────────────────────────────────────────────────

// Settings file (or default locations and environment), then command
// line overrides. --cache-backend / --cache-ttl switch the cache on.
static CacheConfig resolve_cache_config(const CliOptions& opts) {
    CacheConfig config = CacheConfig::load(opts.cache_config);
    if (opts.cache_backend) {
        config.enabled = true;
        config.backend = *opts.cache_backend;
    }
    if (opts.cache_ttl) {
        config.enabled = true;
        config.ttl = *opts.cache_ttl;
    }
    return config;
}

static int run_cache_command(const CliOptions& opts, std::ostream& out, std::ostream& err) {
    CacheConfig config = resolve_cache_config(opts);

    if (opts.cache_command == "config") {
        print_output(config.to_json(), opts.format, out);
        return 0;
    }

    if (opts.no_cache || !config.enabled) {
        err << "Cache is disabled or not configured\n";
        return 1;
    }

    CacheManager manager(config);
    if (opts.cache_command == "stats") {
        print_output(manager.stats(), opts.format, out);
        return 0;
    }

    if (!manager.clear()) {
        err << "Failed to clear cache\n";
        return 1;
    }
    out << "Cache cleared successfully\n";
    return 0;
}

static int run_query_command(const CliOptions& opts, HttpClient& http, std::ostream& out) {
    std::unique_ptr<CacheManager> manager;
    if (!opts.no_cache) {
        CacheConfig config = resolve_cache_config(opts);
        if (config.enabled) manager = std::make_unique<CacheManager>(config);
    }

    EpssClient client(http, EpssClientConfig{}, manager.get());
    bool use_cache = !opts.no_cache;

    nlohmann::json result;
    if (opts.command == "query") {
        result = client.query(opts.query, use_cache, opts.cache_ttl);
    } else if (opts.command == "get") {
        result = client.get(opts.positional.front(), opts.query, use_cache, opts.cache_ttl);
    } else if (opts.command == "batch") {
        result = client.batch(opts.positional, opts.query, use_cache, opts.cache_ttl);
    } else {
        int64_t limit = opts.query.limit.value_or(100);
        std::string order = opts.query.order.value_or("!epss");
        result = client.top(limit, order, opts.query, use_cache, opts.cache_ttl);
    }

    print_output(result, opts.format, out);
    return 0;
}

int run_cli(const std::vector<std::string>& args, HttpClient& http,
            std::ostream& out, std::ostream& err) {
    CliOptions opts;
    try {
        opts = parse_cli(args);
    } catch (const UsageError& e) {
        err << "Error: " << e.what() << "\n\n";
        print_usage(err);
        return 2;
    }

    if (opts.help) {
        print_usage(out);
        return 0;
    }

    try {
        if (opts.command == "cache") return run_cache_command(opts, out, err);
        return run_query_command(opts, http, out);
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace epss
