#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cronkit {

struct Config;
class EventStore;
class Scheduler;
class ScheduleRegistry;
class CronSpawner;
struct CronEvent;

// --key=value arguments after global options are removed
using AssocArgs = std::map<std::string, std::string>;

struct CommandResult {
    bool success = false;
    std::string output;
    bool listing = false;   // output is a rendered listing, not a message
};

// Everything a command handler needs. References are owned by the caller.
struct CommandContext {
    const Config& config;
    EventStore& store;
    Scheduler& scheduler;
    const ScheduleRegistry& schedules;
    CronSpawner& spawner;
    int64_t now = 0;
};

// Field sets of the two listings
extern const std::vector<std::string> kEventDefaultFields;
extern const std::vector<std::string> kEventFields;
extern const std::vector<std::string> kScheduleDefaultFields;

// Listing record of one event, relative to now
nlohmann::json format_event(const CronEvent& event, int64_t now, double gmt_offset);

// Associative args that become the event's arguments
nlohmann::json event_args_from(const AssocArgs& assoc);

CommandResult cmd_event_list(CommandContext& ctx, const AssocArgs& assoc);
CommandResult cmd_event_schedule(CommandContext& ctx, const std::string& hook,
                                 const AssocArgs& assoc);
CommandResult cmd_event_run(CommandContext& ctx, const std::string& hook);
CommandResult cmd_event_delete(CommandContext& ctx, const std::string& hook);
CommandResult cmd_schedule_list(CommandContext& ctx, const AssocArgs& assoc);
CommandResult cmd_cron_test(CommandContext& ctx);

} // namespace cronkit
