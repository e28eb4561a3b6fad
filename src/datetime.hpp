#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace cronkit {

// Resolve a --next_run value to epoch seconds, relative to `now`.
// Accepts Unix timestamps, "@<epoch>", YYYY-MM-DD[ HH:MM[:SS]] (GMT, ISO 'T'
// separator and trailing 'Z' allowed), the keywords now/today/midnight/noon/
// tomorrow/yesterday, and relative phrases such as "+1 hour", "2 days ago",
// "next week" or "+1 day 3 hours". Returns nullopt when the value cannot be
// parsed or resolves to 0.
std::optional<int64_t> parse_next_run(const std::string& value, int64_t now);

// "YYYY-MM-DD HH:MM:SS" in GMT
std::string format_gmt(int64_t timestamp);

// "YYYY-MM-DD HH:MM:SS" shifted by a GMT offset in (possibly fractional) hours
std::string format_local(int64_t timestamp, double gmt_offset_hours);

} // namespace cronkit
