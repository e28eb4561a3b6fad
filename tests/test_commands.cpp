#include <catch2/catch.hpp>
#include "commands.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "mock_http_client.hpp"
#include "scheduler.hpp"
#include "schedules.hpp"
#include "store/json_store.hpp"
#include <filesystem>
#include <unistd.h>

using namespace cronkit;

// 2023-11-14 22:13:20 GMT
static constexpr int64_t kNow = 1700000000;

struct CommandFixture {
    std::string path = "/tmp/cronkit_test_commands_" + std::to_string(getpid()) + ".json";
    Config config;
    JsonEventStore store{path};
    ScheduleRegistry schedules;
    Scheduler scheduler{store, schedules};
    MockHttpClient http;
    CronSpawner spawner{config, store, http};
    CommandContext ctx{config, store, scheduler, schedules, spawner, kNow};

    CommandFixture() { http.next_response.status_code = 200; }
    ~CommandFixture() { std::filesystem::remove(path); }
};

// ── format_event / event_args_from ───────────────────────────────

TEST_CASE("format_event: single event", "[commands]") {
    CronEvent ev;
    ev.hook = "cron_test";
    ev.time = kNow + 3661;
    ev.sig = "sig";

    auto item = format_event(ev, kNow, 2);
    REQUIRE(item["hook"] == "cron_test");
    REQUIRE(item["next_run_gmt"] == "2023-11-14 23:14:21");
    REQUIRE(item["next_run"] == "2023-11-15 01:14:21");
    REQUIRE(item["next_run_relative"] == "1 hour 1 minute");
    REQUIRE(item["recurrence"] == "Non-repeating");
    REQUIRE(item["schedule"] == false);
    REQUIRE(item["interval"].is_null());
    REQUIRE(item["time"] == kNow + 3661);
}

TEST_CASE("format_event: recurring and overdue event", "[commands]") {
    CronEvent ev;
    ev.hook = "cron_daily";
    ev.time = kNow - 10;
    ev.schedule = "daily";
    ev.interval = 90000;

    auto item = format_event(ev, kNow, 0);
    REQUIRE(item["next_run_relative"] == "now");
    REQUIRE(item["recurrence"] == "1 day 1 hour");
    REQUIRE(item["schedule"] == "daily");
    REQUIRE(item["interval"] == 90000);
}

TEST_CASE("event_args_from: excludes command options", "[commands]") {
    AssocArgs assoc = {{"next_run", "+1 hour"}, {"recurrence", "daily"},
                       {"format", "json"}, {"fields", "hook"},
                       {"foo", "1"}, {"bar", "2"}};
    auto args = event_args_from(assoc);
    REQUIRE(args == nlohmann::json({{"bar", "2"}, {"foo", "1"}}));

    REQUIRE(event_args_from({{"next_run", "now"}}) == nlohmann::json::array());
}

// ── event schedule ───────────────────────────────────────────────

TEST_CASE("cmd_event_schedule: defaults to now", "[commands]") {
    CommandFixture f;
    auto r = cmd_event_schedule(f.ctx, "cron_test", {});
    REQUIRE(r.success);
    REQUIRE(r.output == "Scheduled event with hook 'cron_test' for 2023-11-14 22:13:20.");

    auto events = f.scheduler.events();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].time == kNow);
    REQUIRE(events[0].args == nlohmann::json::array());
}

TEST_CASE("cmd_event_schedule: relative next_run and recurrence with args", "[commands]") {
    CommandFixture f;
    auto r = cmd_event_schedule(f.ctx, "cron_test",
                                {{"next_run", "+1 hour"}, {"recurrence", "hourly"},
                                 {"foo", "1"}});
    REQUIRE(r.success);
    REQUIRE(r.output == "Scheduled event with hook 'cron_test' for 2023-11-14 23:13:20.");

    auto events = f.scheduler.events();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].time == kNow + 3600);
    REQUIRE(events[0].schedule == "hourly");
    REQUIRE(events[0].interval == 3600);
    REQUIRE(events[0].args == nlohmann::json({{"foo", "1"}}));
}

TEST_CASE("cmd_event_schedule: numeric next_run is a timestamp", "[commands]") {
    CommandFixture f;
    auto r = cmd_event_schedule(f.ctx, "cron_test", {{"next_run", "1705314600"}});
    REQUIRE(r.success);
    REQUIRE(r.output == "Scheduled event with hook 'cron_test' for 2024-01-15 10:30:00.");
}

TEST_CASE("cmd_event_schedule: invalid datetime", "[commands]") {
    CommandFixture f;
    auto r = cmd_event_schedule(f.ctx, "cron_test", {{"next_run", "whenever"}});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "'whenever' is not a valid datetime.");
    REQUIRE(f.scheduler.events().empty());
}

TEST_CASE("cmd_event_schedule: invalid recurrence", "[commands]") {
    CommandFixture f;
    auto r = cmd_event_schedule(f.ctx, "cron_test", {{"recurrence", "monthly"}});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "'monthly' is not a valid schedule name for recurrence.");
}

TEST_CASE("cmd_event_schedule: duplicate single event not scheduled", "[commands]") {
    CommandFixture f;
    REQUIRE(cmd_event_schedule(f.ctx, "cron_test", {}).success);
    auto r = cmd_event_schedule(f.ctx, "cron_test", {{"next_run", "+5 minutes"}});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "Event not scheduled");
}

// ── event list ───────────────────────────────────────────────────

TEST_CASE("cmd_event_list: empty store prints nothing", "[commands]") {
    CommandFixture f;
    auto r = cmd_event_list(f.ctx, {});
    REQUIRE(r.success);
    REQUIRE(r.listing);
    REQUIRE(r.output.empty());
}

TEST_CASE("cmd_event_list: default fields as csv", "[commands]") {
    CommandFixture f;
    REQUIRE(f.scheduler.schedule_event(kNow + 3600, "daily", "cron_daily",
                                       nlohmann::json::array()));
    REQUIRE(f.scheduler.schedule_single_event(kNow + 90000, "cron_once",
                                              nlohmann::json::array()));

    auto r = cmd_event_list(f.ctx, {{"format", "csv"}});
    REQUIRE(r.success);
    REQUIRE(r.output ==
            "hook,next_run_gmt,next_run_relative,recurrence\n"
            "cron_daily,2023-11-14 23:13:20,1 hour,1 day\n"
            "cron_once,2023-11-15 23:13:20,1 day 1 hour,Non-repeating\n");
}

TEST_CASE("cmd_event_list: ids and fields", "[commands]") {
    CommandFixture f;
    REQUIRE(f.scheduler.schedule_single_event(kNow, "first", nlohmann::json::array()));
    REQUIRE(f.scheduler.schedule_single_event(kNow + 10, "second", nlohmann::json::array()));

    auto ids = cmd_event_list(f.ctx, {{"format", "ids"}});
    REQUIRE(ids.output == "first second");

    auto json = cmd_event_list(f.ctx, {{"format", "json"}, {"fields", "hook,time"}});
    auto parsed = nlohmann::json::parse(json.output);
    REQUIRE(parsed.size() == 2);
    REQUIRE(parsed[1]["hook"] == "second");
    REQUIRE(parsed[1]["time"] == kNow + 10);
    REQUIRE_FALSE(parsed[1].contains("recurrence"));
}

TEST_CASE("cmd_event_list: invalid format and field", "[commands]") {
    CommandFixture f;
    auto bad_format = cmd_event_list(f.ctx, {{"format", "xml"}});
    REQUIRE_FALSE(bad_format.success);
    REQUIRE(bad_format.output == "Invalid format: xml");

    auto bad_field = cmd_event_list(f.ctx, {{"fields", "hook,owner"}});
    REQUIRE_FALSE(bad_field.success);
    REQUIRE(bad_field.output == "Invalid field: owner");
}

// ── event run ────────────────────────────────────────────────────

TEST_CASE("cmd_event_run: no events", "[commands]") {
    CommandFixture f;
    auto r = cmd_event_run(f.ctx, "cron_test");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "You currently have no scheduled cron events.");
}

TEST_CASE("cmd_event_run: queues an immediate copy and spawns", "[commands]") {
    CommandFixture f;
    nlohmann::json args = {{"foo", "1"}};
    REQUIRE(f.scheduler.schedule_event(kNow + 3600, "hourly", "cron_test", args));
    REQUIRE(f.store.set_transient(CronSpawner::kLockName, make_lock_key(kNow)));

    auto r = cmd_event_run(f.ctx, "cron_test");
    REQUIRE(r.success);
    REQUIRE(r.output == "Successfully executed the cron event 'cron_test'");

    // Lock was cleared, so the dispatcher was reached
    REQUIRE(f.http.call_count == 1);
    REQUIRE(f.http.requests[0].timeout_seconds == 1);
    REQUIRE(f.scheduler.is_scheduled(kNow - 1, "cron_test", event_signature(args)));
    REQUIRE(f.scheduler.events().size() == 2);
}

TEST_CASE("cmd_event_run: success does not depend on the dispatcher", "[commands]") {
    CommandFixture f;
    REQUIRE(f.scheduler.schedule_event(kNow + 3600, "hourly", "cron_test",
                                       nlohmann::json::array()));
    f.http.next_response = HttpResponse{0, "", "Failed to connect"};

    auto r = cmd_event_run(f.ctx, "cron_test");
    REQUIRE(r.success);
}

TEST_CASE("cmd_event_run: unknown hook or duplicate run fails", "[commands]") {
    CommandFixture f;
    REQUIRE(f.scheduler.schedule_single_event(kNow + 60, "cron_test",
                                              nlohmann::json::array()));

    auto unknown = cmd_event_run(f.ctx, "other");
    REQUIRE_FALSE(unknown.success);
    REQUIRE(unknown.output == "Failed to the execute the cron event 'other'");

    // An identical single event a minute away blocks the immediate copy
    auto dup = cmd_event_run(f.ctx, "cron_test");
    REQUIRE_FALSE(dup.success);
    REQUIRE(dup.output == "Failed to the execute the cron event 'cron_test'");
}

// ── event delete ─────────────────────────────────────────────────

TEST_CASE("cmd_event_delete: no events", "[commands]") {
    CommandFixture f;
    auto r = cmd_event_delete(f.ctx, "cron_test");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "You currently have no scheduled cron events.");
}

TEST_CASE("cmd_event_delete: removes the first event for the hook", "[commands]") {
    CommandFixture f;
    REQUIRE(f.scheduler.schedule_event(kNow + 7200, "hourly", "cron_test",
                                       nlohmann::json::array()));
    REQUIRE(f.scheduler.schedule_single_event(kNow + 60, "cron_test",
                                              nlohmann::json::array()));

    auto r = cmd_event_delete(f.ctx, "cron_test");
    REQUIRE(r.success);
    REQUIRE(r.output == "Successfully deleted the cron event 'cron_test'");

    auto events = f.scheduler.events();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].time == kNow + 7200);
}

TEST_CASE("cmd_event_delete: unknown hook", "[commands]") {
    CommandFixture f;
    REQUIRE(f.scheduler.schedule_single_event(kNow, "cron_test", nlohmann::json::array()));
    auto r = cmd_event_delete(f.ctx, "other");
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "Failed to the delete the cron event 'other'");
}

// ── schedule list ────────────────────────────────────────────────

TEST_CASE("cmd_schedule_list: ids sorted by interval", "[commands]") {
    CommandFixture f;
    f.schedules.add({"every_minute", "Every Minute", 60});
    auto r = cmd_schedule_list(f.ctx, {{"format", "ids"}});
    REQUIRE(r.success);
    REQUIRE(r.output == "every_minute hourly twicedaily daily weekly");
}

TEST_CASE("cmd_schedule_list: csv with default fields", "[commands]") {
    CommandFixture f;
    auto r = cmd_schedule_list(f.ctx, {{"format", "csv"}});
    REQUIRE(r.output ==
            "name,display,interval\n"
            "hourly,Once Hourly,3600\n"
            "twicedaily,Twice Daily,43200\n"
            "daily,Once Daily,86400\n"
            "weekly,Once Weekly,604800\n");
}

TEST_CASE("cmd_schedule_list: event fields are not valid here", "[commands]") {
    CommandFixture f;
    auto r = cmd_schedule_list(f.ctx, {{"fields", "hook"}});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "Invalid field: hook");
}

// ── cron test ────────────────────────────────────────────────────

TEST_CASE("cmd_cron_test: working dispatcher", "[commands]") {
    CommandFixture f;
    auto r = cmd_cron_test(f.ctx);
    REQUIRE(r.success);
    REQUIRE(r.output == "WP-Cron is working as expected.");
}

TEST_CASE("cmd_cron_test: failure message is reported", "[commands]") {
    CommandFixture f;
    f.http.next_response.status_code = 404;
    auto r = cmd_cron_test(f.ctx);
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "Unexpected HTTP response code: 404");
}
