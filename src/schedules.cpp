#include "schedules.hpp"
#include "config.hpp"

#include <algorithm>
#include <iostream>

namespace cronkit {

bool schedule_interval_less(const Schedule& a, const Schedule& b) {
    return a.interval < b.interval;
}

ScheduleRegistry::ScheduleRegistry() {
    add({"hourly",     "Once Hourly",  3600});
    add({"twicedaily", "Twice Daily",  43200});
    add({"daily",      "Once Daily",   86400});
    add({"weekly",     "Once Weekly",  604800});
}

ScheduleRegistry::ScheduleRegistry(const Config& config) : ScheduleRegistry() {
    for (const auto& [name, entry] : config.schedules) {
        if (entry.interval <= 0) {
            std::cerr << "[schedules] Ignoring schedule '" << name
                      << "' with non-positive interval\n";
            continue;
        }
        add({name, entry.display.empty() ? name : entry.display, entry.interval});
    }
}

void ScheduleRegistry::add(const Schedule& schedule) {
    schedules_[schedule.name] = schedule;
}

bool ScheduleRegistry::contains(const std::string& name) const {
    return schedules_.find(name) != schedules_.end();
}

std::optional<Schedule> ScheduleRegistry::find(const std::string& name) const {
    auto it = schedules_.find(name);
    if (it == schedules_.end()) return std::nullopt;
    return it->second;
}

std::vector<Schedule> ScheduleRegistry::sorted() const {
    std::vector<Schedule> result;
    result.reserve(schedules_.size());
    for (const auto& [_, schedule] : schedules_) {
        result.push_back(schedule);
    }
    std::stable_sort(result.begin(), result.end(), schedule_interval_less);
    return result;
}

} // namespace cronkit
