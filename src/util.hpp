#pragma once
#include <string>
#include <cstdint>

namespace browsetrail {

// Unix epoch milliseconds
int64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase copy
std::string to_lower(std::string s);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Home directory of the invoking user ($HOME, then the passwd entry).
// Returns "" when neither is available.
std::string home_directory();

// Write to a sibling temp file and rename over the target.
// Creates missing parent directories. Returns false on any failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file. Returns "" if it cannot be opened.
std::string read_file(const std::string& path);

// Percent-encode for use in a URL path segment or query value
std::string url_encode(const std::string& s);

// Collapse runs of whitespace to single spaces and trim
std::string collapse_whitespace(const std::string& s);

// Cut to at most max_bytes without splitting a UTF-8 sequence
std::string utf8_truncate(const std::string& s, size_t max_bytes);

} // namespace browsetrail
