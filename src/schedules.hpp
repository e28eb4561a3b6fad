#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cronkit {

struct Config;

struct Schedule {
    std::string name;
    std::string display;
    int64_t interval = 0;
};

// Orders schedules by interval, shortest first
bool schedule_interval_less(const Schedule& a, const Schedule& b);

// Named recurrence intervals: the built-in set plus custom schedules from
// the config file. Custom entries replace built-ins with the same name.
class ScheduleRegistry {
public:
    ScheduleRegistry();
    explicit ScheduleRegistry(const Config& config);

    void add(const Schedule& schedule);

    bool contains(const std::string& name) const;
    std::optional<Schedule> find(const std::string& name) const;

    // All schedules sorted by interval (ties in name order)
    std::vector<Schedule> sorted() const;

    size_t size() const { return schedules_.size(); }

private:
    std::map<std::string, Schedule> schedules_;
};

} // namespace cronkit
