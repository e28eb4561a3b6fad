#include <catch2/catch.hpp>
#include "cli.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "mock_http_client.hpp"
#include "scheduler.hpp"
#include "schedules.hpp"
#include "store/json_store.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <unistd.h>

using namespace cronkit;

// ── parse_args ───────────────────────────────────────────────────

TEST_CASE("parse_args: positional and associative arguments", "[cli]") {
    auto parsed = parse_args({"cron", "event", "schedule", "cron_test",
                              "--next_run=+1 hour", "--foo=a=b", "--verbose"});
    REQUIRE(parsed.positional == std::vector<std::string>{"cron", "event", "schedule",
                                                          "cron_test"});
    REQUIRE(parsed.assoc.at("next_run") == "+1 hour");
    REQUIRE(parsed.assoc.at("foo") == "a=b");
    REQUIRE(parsed.assoc.at("verbose") == "true");
    REQUIRE_FALSE(parsed.help);
}

TEST_CASE("parse_args: help flags", "[cli]") {
    REQUIRE(parse_args({"-h"}).help);
    REQUIRE(parse_args({"event", "list", "--help"}).help);
}

TEST_CASE("apply_global_options: moves overrides into config", "[cli]") {
    AssocArgs assoc = {{"store", "sqlite"}, {"store-path", "/tmp/x.db"},
                       {"site-url", "https://example.org"}, {"foo", "1"}};
    Config cfg;
    apply_global_options(assoc, cfg);

    REQUIRE(cfg.store == "sqlite");
    REQUIRE(cfg.store_path == "/tmp/x.db");
    REQUIRE(cfg.site_url == "https://example.org");
    REQUIRE(assoc.size() == 1);
    REQUIRE(assoc.count("foo") == 1);
}

// ── dispatch ─────────────────────────────────────────────────────

struct DispatchFixture {
    std::string path = "/tmp/cronkit_test_cli_" + std::to_string(getpid()) + ".json";
    Config config;
    JsonEventStore store{path};
    ScheduleRegistry schedules;
    Scheduler scheduler{store, schedules};
    MockHttpClient http;
    CronSpawner spawner{config, store, http};
    CommandContext ctx{config, store, scheduler, schedules, spawner, 1700000000};

    DispatchFixture() { http.next_response.status_code = 200; }
    ~DispatchFixture() { std::filesystem::remove(path); }

    CommandResult run(const std::vector<std::string>& args) {
        return dispatch(parse_args(args), ctx);
    }
};

TEST_CASE("dispatch: leading cron word is optional", "[cli]") {
    DispatchFixture f;
    auto with = f.run({"cron", "schedule", "list", "--format=ids"});
    auto without = f.run({"schedule", "list", "--format=ids"});
    REQUIRE(with.success);
    REQUIRE(with.output == without.output);
}

TEST_CASE("dispatch: routes event subcommands", "[cli]") {
    DispatchFixture f;
    auto scheduled = f.run({"event", "schedule", "cron_test", "--recurrence=daily"});
    REQUIRE(scheduled.success);
    REQUIRE_FALSE(scheduled.listing);

    auto listed = f.run({"event", "list", "--format=ids"});
    REQUIRE(listed.listing);
    REQUIRE(listed.output == "cron_test");

    auto deleted = f.run({"cron", "event", "delete", "cron_test"});
    REQUIRE(deleted.success);
    REQUIRE(f.scheduler.events().empty());
}

TEST_CASE("dispatch: routes test", "[cli]") {
    DispatchFixture f;
    auto r = f.run({"test"});
    REQUIRE(r.success);
    REQUIRE(f.http.call_count == 1);
}

TEST_CASE("dispatch: missing hook is a usage error", "[cli]") {
    DispatchFixture f;
    auto r = f.run({"event", "run"});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "usage: cronkit cron event run <hook>");
}

TEST_CASE("dispatch: unknown commands", "[cli]") {
    DispatchFixture f;
    REQUIRE_FALSE(f.run({}).success);
    REQUIRE_FALSE(f.run({"event", "pause", "x"}).success);
    REQUIRE_FALSE(f.run({"schedule", "add"}).success);

    auto r = f.run({"cron", "rewind"});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.output == "'rewind' is not a registered cron subcommand.");
}

// ── run_cli ──────────────────────────────────────────────────────

// RAII guard: HOME in a temp dir so Config::load() never touches the real one
struct CliHomeGuard {
    std::string dir;
    std::string old_home;

    CliHomeGuard() {
        auto path = std::filesystem::temp_directory_path() / "cronkit_cli_XXXXXX";
        std::string tmpl = path.string();
        char* result = mkdtemp(tmpl.data());
        dir = result ? std::string(result) : "";
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("CRONKIT_STORE");
        unsetenv("CRONKIT_STORE_PATH");
        unsetenv("CRONKIT_SITE_URL");
        unsetenv("ALTERNATE_WP_CRON");
    }

    ~CliHomeGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    CliHomeGuard(const CliHomeGuard&) = delete;
    CliHomeGuard& operator=(const CliHomeGuard&) = delete;
};

TEST_CASE("run_cli: help prints usage", "[cli]") {
    CliHomeGuard g;
    std::ostringstream out, err;
    REQUIRE(run_cli({"--help"}, out, err) == 0);
    REQUIRE(out.str().find("Usage: cronkit") == 0);
    REQUIRE(err.str().empty());
}

TEST_CASE("run_cli: schedule then list through the default json store", "[cli]") {
    CliHomeGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::ostringstream out, err;
    REQUIRE(run_cli({"cron", "event", "schedule", "cron_test", "--next_run=2030-01-01"},
                    out, err) == 0);
    REQUIRE(out.str() == "Success: Scheduled event with hook 'cron_test' for "
                         "2030-01-01 00:00:00.\n");
    REQUIRE(std::filesystem::exists(g.dir + "/.cronkit/cron.json"));

    std::ostringstream list_out, list_err;
    REQUIRE(run_cli({"event", "list", "--format=ids"}, list_out, list_err) == 0);
    REQUIRE(list_out.str() == "cron_test\n");
}

TEST_CASE("run_cli: sqlite store selected on the command line", "[cli]") {
    CliHomeGuard g;
    std::string db = g.dir + "/events.db";

    std::ostringstream out, err;
    REQUIRE(run_cli({"event", "schedule", "cron_test", "--next_run=2030-01-01",
                     "--store=sqlite", "--store-path=" + db}, out, err) == 0);
    REQUIRE(std::filesystem::exists(db));

    std::ostringstream list_out, list_err;
    REQUIRE(run_cli({"event", "list", "--fields=hook", "--format=csv",
                     "--store=sqlite", "--store-path=" + db}, list_out, list_err) == 0);
    REQUIRE(list_out.str() == "hook\ncron_test\n");
}

TEST_CASE("run_cli: errors go to stderr with status 1", "[cli]") {
    CliHomeGuard g;
    std::ostringstream out, err;
    REQUIRE(run_cli({"event", "delete", "cron_test"}, out, err) == 1);
    REQUIRE(out.str().empty());
    REQUIRE(err.str() == "Error: You currently have no scheduled cron events.\n");
}

TEST_CASE("run_cli: unknown store backend", "[cli]") {
    CliHomeGuard g;
    std::ostringstream out, err;
    REQUIRE(run_cli({"event", "list", "--store=redis"}, out, err) == 1);
    REQUIRE(err.str() == "Error: Unknown store backend: redis\n");
}

TEST_CASE("run_cli: empty listing prints nothing", "[cli]") {
    CliHomeGuard g;
    std::ostringstream out, err;
    REQUIRE(run_cli({"event", "list"}, out, err) == 0);
    REQUIRE(out.str().empty());
}
