#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace cronkit {

struct DurationUnit {
    int64_t seconds_per_unit;
    const char* singular_label;
    const char* plural_label;
};

// Largest unit first. Year and month are fixed 365/30-day approximations,
// not calendar arithmetic.
inline constexpr std::array<DurationUnit, 7> kDurationUnits = {{
    {60 * 60 * 24 * 365, "year",   "years"},
    {60 * 60 * 24 * 30,  "month",  "months"},
    {60 * 60 * 24 * 7,   "week",   "weeks"},
    {60 * 60 * 24,       "day",    "days"},
    {60 * 60,            "hour",   "hours"},
    {60,                 "minute", "minutes"},
    {1,                  "second", "seconds"},
}};

// Singular label for a count of exactly 1, plural otherwise (including 0).
std::string plural_label(uint64_t count, const std::string& singular,
                         const std::string& plural);

// Human-readable interval of at most two chunks, e.g. "3 days 4 hours".
// Non-positive input yields "now".
std::string format_interval(int64_t seconds);

} // namespace cronkit
