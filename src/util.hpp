#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace cronkit {

// Unix epoch seconds
int64_t epoch_seconds();

// Unix epoch as fractional seconds (microsecond resolution)
double epoch_seconds_precise();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lower-case copy
std::string to_lower(const std::string& s);

// Join strings with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// True when s is non-empty and every character is a decimal digit
bool is_digits(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write contents to a sibling temp file, then rename over path.
// Creates the parent directory if needed.
bool atomic_write_file(const std::string& path, const std::string& contents);

} // namespace cronkit
