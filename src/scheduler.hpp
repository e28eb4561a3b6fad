#pragma once
#include "event_store.hpp"
#include "schedules.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cronkit {

// Hex MD5 of the compact JSON form of args; identical args share a signature.
std::string event_signature(const nlohmann::json& args);

// Scheduling operations over an EventStore, following the host platform's
// rules for single and recurring events.
class Scheduler {
public:
    // A single event is refused when an identical one is this close.
    static constexpr int64_t kDuplicateWindow = 600;

    Scheduler(EventStore& store, const ScheduleRegistry& schedules);

    // All events ordered by time, then hook, then signature.
    std::vector<CronEvent> events();

    bool schedule_single_event(int64_t timestamp, const std::string& hook,
                               const nlohmann::json& args);

    // False when recurrence is not a known schedule name.
    bool schedule_event(int64_t timestamp, const std::string& recurrence,
                        const std::string& hook, const nlohmann::json& args);

    // False when no such event is stored.
    bool unschedule_event(int64_t timestamp, const std::string& hook,
                          const nlohmann::json& args);

    // Same, addressing the entry by its stored signature.
    bool unschedule_signature(int64_t timestamp, const std::string& hook,
                              const std::string& sig);

    bool is_scheduled(int64_t timestamp, const std::string& hook,
                      const std::string& sig);

    std::optional<int64_t> next_scheduled(const std::string& hook,
                                          const nlohmann::json& args);

private:
    EventStore& store_;
    const ScheduleRegistry& schedules_;
};

} // namespace cronkit
