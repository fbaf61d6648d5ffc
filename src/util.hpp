#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace engram {

// ISO 8601 timestamp (UTC) for the current time
std::string timestamp_now();

// ISO 8601 timestamp (UTC) for the given epoch seconds
std::string format_timestamp(uint64_t epoch);

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lower-casing; multi-byte UTF-8 sequences pass through untouched
std::string to_lower(const std::string& s);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Generate a unique ID: prefix followed by 16 hex chars
std::string generate_id(const std::string& prefix = "");

// First max_chars characters of a UTF-8 string, never splitting a sequence
std::string utf8_prefix(const std::string& s, size_t max_chars);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to path via a temp file + rename
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace engram
