#include "commands.hpp"
#include "config.hpp"
#include "datetime.hpp"
#include "dispatcher.hpp"
#include "duration.hpp"
#include "event_store.hpp"
#include "output.hpp"
#include "scheduler.hpp"
#include "schedules.hpp"
#include <iostream>
#include <optional>

namespace cronkit {

const std::vector<std::string> kEventDefaultFields = {
    "hook", "next_run_gmt", "next_run_relative", "recurrence"};
const std::vector<std::string> kEventFields = {
    "hook", "next_run", "next_run_gmt", "next_run_relative", "recurrence",
    "time", "sig", "args", "schedule", "interval"};
const std::vector<std::string> kScheduleDefaultFields = {"name", "display", "interval"};

static const char* const kNoEvents = "You currently have no scheduled cron events.";

static CommandResult ok(const std::string& msg) { return {true, msg, false}; }
static CommandResult fail(const std::string& msg) { return {false, msg, false}; }
static CommandResult listing(const std::string& text) { return {true, text, true}; }

static std::string assoc_value(const AssocArgs& assoc, const std::string& key) {
    auto it = assoc.find(key);
    return it == assoc.end() ? "" : it->second;
}

nlohmann::json format_event(const CronEvent& event, int64_t now, double gmt_offset) {
    nlohmann::json item;
    item["hook"] = event.hook;
    item["next_run"] = format_local(event.time, gmt_offset);
    item["next_run_gmt"] = format_gmt(event.time);
    item["next_run_relative"] = format_interval(event.time - now);
    item["recurrence"] = event.schedule.empty()
        ? std::string("Non-repeating")
        : format_interval(event.interval.value_or(0));
    item["time"] = event.time;
    item["sig"] = event.sig;
    item["args"] = event.args;
    item["schedule"] = event.schedule.empty() ? nlohmann::json(false)
                                              : nlohmann::json(event.schedule);
    item["interval"] = event.interval ? nlohmann::json(*event.interval) : nlohmann::json();
    return item;
}

nlohmann::json event_args_from(const AssocArgs& assoc) {
    nlohmann::json args = nlohmann::json::object();
    for (const auto& [key, value] : assoc) {
        if (key == "next_run" || key == "recurrence" ||
            key == "format" || key == "fields") continue;
        args[key] = value;
    }
    // No extra args stores an empty list, as the host does
    if (args.empty()) return nlohmann::json::array();
    return args;
}

// First event (time order) for the hook
static std::optional<CronEvent> find_first_event(const std::vector<CronEvent>& events,
                                                 const std::string& hook) {
    for (const auto& ev : events) {
        if (ev.hook == hook) return ev;
    }
    return std::nullopt;
}

CommandResult cmd_event_list(CommandContext& ctx, const AssocArgs& assoc) {
    auto formatter = Formatter::from_args(assoc_value(assoc, "format"),
                                          assoc_value(assoc, "fields"),
                                          kEventDefaultFields);
    std::string err = formatter.validate(kEventFields);
    if (!err.empty()) return fail(err);

    std::vector<nlohmann::json> items;
    for (const auto& ev : ctx.scheduler.events()) {
        items.push_back(format_event(ev, ctx.now, ctx.config.gmt_offset));
    }
    return listing(formatter.render(items, "hook"));
}

CommandResult cmd_event_schedule(CommandContext& ctx, const std::string& hook,
                                 const AssocArgs& assoc) {
    int64_t timestamp = ctx.now;
    auto next_run = assoc.find("next_run");
    if (next_run != assoc.end()) {
        auto parsed = parse_next_run(next_run->second, ctx.now);
        if (!parsed) {
            return fail("'" + next_run->second + "' is not a valid datetime.");
        }
        timestamp = *parsed;
    }

    nlohmann::json args = event_args_from(assoc);

    bool scheduled = false;
    auto recurrence = assoc.find("recurrence");
    if (recurrence != assoc.end()) {
        if (!ctx.schedules.contains(recurrence->second)) {
            return fail("'" + recurrence->second +
                        "' is not a valid schedule name for recurrence.");
        }
        scheduled = ctx.scheduler.schedule_event(timestamp, recurrence->second, hook, args);
    } else {
        scheduled = ctx.scheduler.schedule_single_event(timestamp, hook, args);
    }

    if (!scheduled) return fail("Event not scheduled");
    return ok("Scheduled event with hook '" + hook + "' for " + format_gmt(timestamp) + ".");
}

CommandResult cmd_event_run(CommandContext& ctx, const std::string& hook) {
    auto events = ctx.scheduler.events();
    if (events.empty()) return fail(kNoEvents);

    bool executed = false;
    if (auto event = find_first_event(events, hook)) {
        // Run now by queueing an immediate single copy and kicking the dispatcher
        ctx.store.delete_transient(CronSpawner::kLockName);
        if (ctx.scheduler.schedule_single_event(ctx.now - 1, event->hook, event->args)) {
            if (!ctx.spawner.spawn(ctx.now) && !ctx.config.alternate_cron) {
                std::cerr << "[spawn] Dispatcher not reached, event will run on next spawn\n";
            }
            executed = true;
        }
    }

    if (executed) return ok("Successfully executed the cron event '" + hook + "'");
    return fail("Failed to the execute the cron event '" + hook + "'");
}

CommandResult cmd_event_delete(CommandContext& ctx, const std::string& hook) {
    auto events = ctx.scheduler.events();
    if (events.empty()) return fail(kNoEvents);

    bool deleted = false;
    if (auto event = find_first_event(events, hook)) {
        if (ctx.scheduler.is_scheduled(event->time, event->hook, event->sig)) {
            deleted = ctx.scheduler.unschedule_signature(event->time, event->hook, event->sig);
        }
    }

    if (deleted) return ok("Successfully deleted the cron event '" + hook + "'");
    return fail("Failed to the delete the cron event '" + hook + "'");
}

CommandResult cmd_schedule_list(CommandContext& ctx, const AssocArgs& assoc) {
    auto formatter = Formatter::from_args(assoc_value(assoc, "format"),
                                          assoc_value(assoc, "fields"),
                                          kScheduleDefaultFields);
    std::string err = formatter.validate(kScheduleDefaultFields);
    if (!err.empty()) return fail(err);

    std::vector<nlohmann::json> items;
    for (const auto& s : ctx.schedules.sorted()) {
        items.push_back({{"name", s.name}, {"display", s.display}, {"interval", s.interval}});
    }
    return listing(formatter.render(items, "name"));
}

CommandResult cmd_cron_test(CommandContext& ctx) {
    auto status = ctx.spawner.test_spawn();
    if (!status.ok) return fail(status.message);
    return ok("WP-Cron is working as expected.");
}

} // namespace cronkit
