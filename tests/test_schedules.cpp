#include <catch2/catch.hpp>
#include "schedules.hpp"
#include "config.hpp"

using namespace cronkit;

TEST_CASE("ScheduleRegistry: built-in schedules", "[schedules]") {
    ScheduleRegistry reg;
    REQUIRE(reg.size() == 4);

    auto hourly = reg.find("hourly");
    REQUIRE(hourly.has_value());
    REQUIRE(hourly->interval == 3600);
    REQUIRE(hourly->display == "Once Hourly");

    REQUIRE(reg.find("twicedaily")->interval == 43200);
    REQUIRE(reg.find("daily")->display == "Once Daily");
    REQUIRE(reg.find("weekly")->interval == 604800);
}

TEST_CASE("ScheduleRegistry: unknown name", "[schedules]") {
    ScheduleRegistry reg;
    REQUIRE_FALSE(reg.contains("monthly"));
    REQUIRE_FALSE(reg.find("monthly").has_value());
}

TEST_CASE("ScheduleRegistry: sorted by interval", "[schedules]") {
    ScheduleRegistry reg;
    reg.add({"every_minute", "Every Minute", 60});
    reg.add({"monthly", "Monthly", 2592000});

    auto sorted = reg.sorted();
    REQUIRE(sorted.size() == 6);
    REQUIRE(sorted.front().name == "every_minute");
    REQUIRE(sorted[1].name == "hourly");
    REQUIRE(sorted[2].name == "twicedaily");
    REQUIRE(sorted[3].name == "daily");
    REQUIRE(sorted[4].name == "weekly");
    REQUIRE(sorted.back().name == "monthly");
}

TEST_CASE("ScheduleRegistry: equal intervals keep name order", "[schedules]") {
    ScheduleRegistry reg;
    reg.add({"b_hourly", "B", 3600});
    reg.add({"a_hourly", "A", 3600});

    auto sorted = reg.sorted();
    REQUIRE(sorted[0].name == "a_hourly");
    REQUIRE(sorted[1].name == "b_hourly");
    REQUIRE(sorted[2].name == "hourly");
}

TEST_CASE("schedule_interval_less: compares intervals only", "[schedules]") {
    Schedule a{"z", "Z", 60};
    Schedule b{"a", "A", 120};
    REQUIRE(schedule_interval_less(a, b));
    REQUIRE_FALSE(schedule_interval_less(b, a));
    REQUIRE_FALSE(schedule_interval_less(a, a));
}

TEST_CASE("ScheduleRegistry: custom schedules from config", "[schedules]") {
    Config cfg;
    cfg.schedules["every_five"] = {300, "Every Five Minutes"};
    cfg.schedules["daily"] = {86400, "Every Day"};
    cfg.schedules["nameless"] = {900, ""};
    cfg.schedules["broken"] = {0, "Never"};

    ScheduleRegistry reg(cfg);
    REQUIRE(reg.find("every_five")->interval == 300);
    REQUIRE(reg.find("daily")->display == "Every Day");
    REQUIRE(reg.find("nameless")->display == "nameless");
    REQUIRE_FALSE(reg.contains("broken"));
    REQUIRE(reg.size() == 6);
}
