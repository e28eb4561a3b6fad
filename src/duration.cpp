#include "duration.hpp"

namespace cronkit {

std::string plural_label(uint64_t count, const std::string& singular,
                         const std::string& plural) {
    return count == 1 ? singular : plural;
}

static std::string format_chunk(uint64_t count, const DurationUnit& unit) {
    return std::to_string(count) + " " +
           plural_label(count, unit.singular_label, unit.plural_label);
}

std::string format_interval(int64_t seconds) {
    if (seconds <= 0) {
        return "now";
    }

    // seconds > 0 here, so the magnitude is the value itself
    auto total = static_cast<uint64_t>(seconds);

    size_t i = 0;
    uint64_t count = 0;
    for (; i < kDurationUnits.size(); ++i) {
        count = total / static_cast<uint64_t>(kDurationUnits[i].seconds_per_unit);
        if (count != 0) break;
    }
    // The 1-second unit always divides a positive total
    const DurationUnit& first = kDurationUnits[i];
    std::string output = format_chunk(count, first);

    if (i + 1 < kDurationUnits.size()) {
        const DurationUnit& second = kDurationUnits[i + 1];
        uint64_t remainder = total - static_cast<uint64_t>(first.seconds_per_unit) * count;
        uint64_t count2 = remainder / static_cast<uint64_t>(second.seconds_per_unit);
        if (count2 != 0) {
            output += " " + format_chunk(count2, second);
        }
    }

    return output;
}

} // namespace cronkit
