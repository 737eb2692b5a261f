#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace epss {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Join strings with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Percent-encode a query-string component (RFC 3986 unreserved kept)
std::string url_encode(const std::string& s);

// Write via a temp file + rename so readers never see a partial file.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace epss
