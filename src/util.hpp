#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace docserve {

// Unix epoch milliseconds (wall clock)
uint64_t epoch_millis();

// ISO 8601 timestamp for an epoch-milliseconds value
std::string iso8601_from_millis(uint64_t ms);

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(std::string s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Escape &, <, >, " and ' for embedding in HTML
std::string html_escape(const std::string& s);

// Percent-decode a URL component ('+' becomes a space)
std::string url_decode(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// Write to path.tmp then rename over path. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

// Modification time of a file in epoch milliseconds. Returns false if the
// file cannot be stat'ed.
bool file_mtime_millis(const std::string& path, uint64_t& out);

} // namespace docserve
