#include "datetime.hpp"
#include "util.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace cronkit {

namespace {

enum Field { kSec = 0, kMin, kHour, kDay, kMonth, kYear, kFieldCount };

struct UnitSpec {
    const char* name;
    Field field;
    int multiplier;
};

constexpr UnitSpec kUnits[] = {
    {"sec",       kSec,   1},
    {"second",    kSec,   1},
    {"min",       kMin,   1},
    {"minute",    kMin,   1},
    {"hour",      kHour,  1},
    {"day",       kDay,   1},
    {"week",      kDay,   7},
    {"fortnight", kDay,   14},
    {"month",     kMonth, 1},
    {"year",      kYear,  1},
};

bool lookup_unit(std::string token, Field& field, int& multiplier) {
    if (token.size() > 1 && token.back() == 's') token.pop_back();
    for (const auto& u : kUnits) {
        if (token == u.name) {
            field = u.field;
            multiplier = u.multiplier;
            return true;
        }
    }
    return false;
}

bool parse_date(const std::string& tok, std::tm& tm, std::string& rest) {
    int y = 0, m = 0, d = 0, n = 0;
    if (std::sscanf(tok.c_str(), "%4d-%2d-%2d%n", &y, &m, &d, &n) != 3) return false;
    if (y < 1970 || m < 1 || m > 12 || d < 1 || d > 31) return false;
    tm.tm_year = y - 1900;
    tm.tm_mon = m - 1;
    tm.tm_mday = d;
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    rest = tok.substr(static_cast<size_t>(n));
    return true;
}

bool parse_clock(std::string tok, std::tm& tm) {
    if (!tok.empty() && tok.back() == 'z') tok.pop_back();
    int h = 0, mi = 0, s = 0, n = 0;
    int size = static_cast<int>(tok.size());
    if (std::sscanf(tok.c_str(), "%2d:%2d:%2d%n", &h, &mi, &s, &n) == 3 && n == size) {
        // HH:MM:SS
    } else {
        n = 0;
        s = 0;
        if (std::sscanf(tok.c_str(), "%2d:%2d%n", &h, &mi, &n) != 2 || n != size)
            return false;
    }
    if (h < 0 || h > 23 || mi < 0 || mi > 59 || s < 0 || s > 59) return false;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = s;
    return true;
}

// Split "+3hours" into "+3" and "hours"; unit is empty when none is attached.
bool split_amount(const std::string& tok, int64_t& amount, std::string& unit) {
    size_t pos = 0;
    int sign = 1;
    if (pos < tok.size() && (tok[pos] == '+' || tok[pos] == '-')) {
        if (tok[pos] == '-') sign = -1;
        ++pos;
    }
    size_t digits_start = pos;
    while (pos < tok.size() && tok[pos] >= '0' && tok[pos] <= '9') ++pos;
    if (pos == digits_start) return false;
    try {
        amount = sign * std::stoll(tok.substr(digits_start, pos - digits_start));
    } catch (const std::out_of_range&) {
        return false;
    }
    unit = tok.substr(pos);
    return true;
}

// 9999-12-31 23:59:59 GMT, the last instant with a four-digit year
constexpr int64_t kMaxTimestamp = 253402300799;

constexpr int64_t kFieldSeconds[] = {1, 60, 3600, 86400};

// Overflow-checked int64 arithmetic; false leaves `out` unspecified.
bool checked_mul(int64_t a, int64_t b, int64_t& out) {
    return !__builtin_mul_overflow(a, b, &out);
}

bool checked_add(int64_t a, int64_t b, int64_t& out) {
    return !__builtin_add_overflow(a, b, &out);
}

bool accumulate(int64_t& offset, int64_t amount, int64_t mult) {
    int64_t scaled = 0;
    return checked_mul(amount, mult, scaled) && checked_add(offset, scaled, offset);
}

std::optional<int64_t> epoch_in_range(int64_t ts) {
    if (ts <= 0 || ts > kMaxTimestamp) return std::nullopt;
    return ts;
}

void start_of_day(std::tm& tm) {
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
}

} // namespace

std::optional<int64_t> parse_next_run(const std::string& value, int64_t now) {
    std::string s = to_lower(trim(value));
    if (s.empty()) return std::nullopt;

    // Plain integers are epoch timestamps; the sign is discarded
    std::string unsigned_part = (s[0] == '-' || s[0] == '+') ? s.substr(1) : s;
    if (is_digits(unsigned_part)) {
        try {
            return epoch_in_range(std::stoll(unsigned_part));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }
    if (s[0] == '@' && is_digits(s.substr(1))) {
        try {
            return epoch_in_range(std::stoll(s.substr(1)));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    std::vector<std::string> tokens;
    {
        std::istringstream stream(s);
        std::string tok;
        while (stream >> tok) tokens.push_back(tok);
    }

    std::time_t base = static_cast<std::time_t>(now);
    std::tm tm{};
    gmtime_r(&base, &tm);

    int64_t offsets[kFieldCount] = {0, 0, 0, 0, 0, 0};

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& tok = tokens[i];

        if (tok == "now") continue;
        if (tok == "today" || tok == "midnight") { start_of_day(tm); continue; }
        if (tok == "noon") { start_of_day(tm); tm.tm_hour = 12; continue; }
        if (tok == "tomorrow") { start_of_day(tm); offsets[kDay] += 1; continue; }
        if (tok == "yesterday") { start_of_day(tm); offsets[kDay] -= 1; continue; }

        if (tok == "next" || tok == "last") {
            Field field = kSec;
            int mult = 0;
            if (i + 1 >= tokens.size() || !lookup_unit(tokens[i + 1], field, mult))
                return std::nullopt;
            if (!accumulate(offsets[field], tok == "next" ? 1 : -1, mult))
                return std::nullopt;
            ++i;
            continue;
        }

        std::string rest;
        if (parse_date(tok, tm, rest)) {
            if (rest.empty()) continue;
            if (rest[0] == 't' && parse_clock(rest.substr(1), tm)) continue;
            return std::nullopt;
        }

        if (parse_clock(tok, tm)) continue;

        int64_t amount = 0;
        std::string unit;
        if (split_amount(tok, amount, unit)) {
            if (unit.empty()) {
                if (i + 1 >= tokens.size()) return std::nullopt;
                unit = tokens[++i];
            }
            Field field = kSec;
            int mult = 0;
            if (!lookup_unit(unit, field, mult)) return std::nullopt;
            if (i + 1 < tokens.size() && tokens[i + 1] == "ago") {
                amount = -amount;
                ++i;
            }
            if (!accumulate(offsets[field], amount, mult)) return std::nullopt;
            continue;
        }

        return std::nullopt;
    }

    // Calendar fields go through timegm; anything beyond year 9999 is
    // rejected before it can overflow the int members of std::tm.
    constexpr int64_t kMaxYears = 10000;
    if (offsets[kYear] > kMaxYears || offsets[kYear] < -kMaxYears ||
        offsets[kMonth] > kMaxYears * 12 || offsets[kMonth] < -kMaxYears * 12) {
        return std::nullopt;
    }
    tm.tm_mon  += static_cast<int>(offsets[kMonth]);
    tm.tm_year += static_cast<int>(offsets[kYear]);
    tm.tm_isdst = 0;

    std::time_t base_result = timegm(&tm);
    if (base_result == static_cast<std::time_t>(-1)) return std::nullopt;

    // Fixed-length units are plain seconds on top
    int64_t result = static_cast<int64_t>(base_result);
    for (int f = kSec; f <= kDay; ++f) {
        if (!accumulate(result, offsets[f], kFieldSeconds[f])) return std::nullopt;
    }
    return epoch_in_range(result);
}

std::string format_gmt(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm tm_buf{};
    char buf[64];
    if (!gmtime_r(&t, &tm_buf) ||
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf) == 0) {
        return std::to_string(timestamp);
    }
    return buf;
}

std::string format_local(int64_t timestamp, double gmt_offset_hours) {
    auto shift = static_cast<int64_t>(std::llround(gmt_offset_hours * 3600.0));
    int64_t shifted = 0;
    if (!checked_add(timestamp, shift, shifted)) return std::to_string(timestamp);
    return format_gmt(shifted);
}

} // namespace cronkit
