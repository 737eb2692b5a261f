#pragma once
#include "epss_client.hpp"
#include "http.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace epss {

// Bad command line. run_cli maps it to exit code 2.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    std::string command;                  // query, get, batch, top, cache
    std::string cache_command;            // stats, clear, config
    std::vector<std::string> positional;  // CVE ids
    QueryParams query;
    std::string format = "json";

    std::optional<std::string> cache_config;
    std::optional<std::string> cache_backend;
    std::optional<uint32_t> cache_ttl;
    bool no_cache = false;
    bool help = false;
};

// Parse arguments (program name excluded). Throws UsageError.
CliOptions parse_cli(const std::vector<std::string>& args);

// Returns the process exit code: 0 ok, 1 error, 2 usage.
int run_cli(const std::vector<std::string>& args, HttpClient& http,
            std::ostream& out, std::ostream& err);

void print_usage(std::ostream& out);

// json: indented with sorted keys. csv: the "data" rows.
void print_output(const nlohmann::json& obj, const std::string& format, std::ostream& out);

// Header is the sorted union of row keys; missing cells are empty.
void write_csv(const nlohmann::json& rows, std::ostream& out);

} // namespace epss
