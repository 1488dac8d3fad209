#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace mcpgate {

// ISO 8601 timestamp (UTC, second resolution)
std::string timestamp_now();

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Split on runs of whitespace, dropping empty fields
std::vector<std::string> split_whitespace(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// "1", "true", "yes" (any case) are true; everything else is false.
bool parse_bool_like(const std::string& s);

// Percent-encode everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to <path>.tmp-<pid> in the same directory, then rename over path.
// Creates the parent directory if missing. Returns false and sets error on failure.
bool atomic_write_file(const std::string& path, const std::string& content,
                       std::string& error);

} // namespace mcpgate
