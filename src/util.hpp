#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace troupe {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Case-insensitive ASCII equality
bool iequals(const std::string& a, const std::string& b);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Percent-encode everything except RFC 3986 unreserved characters
std::string url_encode(const std::string& s);

// Same escaping as ECMAScript encodeURIComponent (also keeps !*'())
std::string uri_component_encode(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Read a whole file as text. Throws std::runtime_error if it cannot be opened.
std::string read_file(const std::string& path);

} // namespace troupe
