#include "cli.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "event_store.hpp"
#include "http.hpp"
#include "scheduler.hpp"
#include "schedules.hpp"
#include "util.hpp"
#include <ostream>
#include <stdexcept>

namespace cronkit {

ParsedArgs parse_args(const std::vector<std::string>& args) {
    ParsedArgs parsed;
    for (const auto& arg : args) {
        if (arg == "-h" || arg == "--help") {
            parsed.help = true;
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            size_t eq = arg.find('=');
            if (eq == std::string::npos) {
                parsed.assoc[arg.substr(2)] = "true";
            } else {
                parsed.assoc[arg.substr(2, eq - 2)] = arg.substr(eq + 1);
            }
        } else {
            parsed.positional.push_back(arg);
        }
    }
    return parsed;
}

void apply_global_options(AssocArgs& assoc, Config& config) {
    auto take = [&assoc](const std::string& key, std::string& target) {
        auto it = assoc.find(key);
        if (it == assoc.end()) return;
        target = it->second;
        assoc.erase(it);
    };
    take("store", config.store);
    take("store-path", config.store_path);
    take("site-url", config.site_url);
}

std::string usage_text() {
    return "Usage: cronkit [cron] <command> [options]\n"
           "\n"
           "Commands:\n"
           "  event list [--fields=<fields>] [--format=<format>]\n"
           "                       List scheduled cron events\n"
           "  event schedule <hook> [--next_run=<value>] [--recurrence=<name>] [--<field>=<value>...]\n"
           "                       Schedule a new cron event\n"
           "  event run <hook>     Run the next scheduled event for the hook\n"
           "  event delete <hook>  Delete the next scheduled event for the hook\n"
           "  schedule list [--fields=<fields>] [--format=<format>]\n"
           "                       List available cron schedules\n"
           "  test                 Test the cron spawning system\n"
           "\n"
           "Formats: table (default), json, csv, ids\n"
           "\n"
           "Global options:\n"
           "  --store=<json|sqlite>  Event store backend\n"
           "  --store-path=<path>    Event store file\n"
           "  --site-url=<url>       Site URL of the dispatcher\n"
           "  -h, --help             Show this help\n"
           "\n"
           "Environment variables:\n"
           "  CRONKIT_STORE          Event store backend\n"
           "  CRONKIT_STORE_PATH     Event store file\n"
           "  CRONKIT_SITE_URL       Site URL of the dispatcher\n"
           "  CRONKIT_GMT_OFFSET     Hours added for the local next_run column\n"
           "  ALTERNATE_WP_CRON      Set to 1 to skip HTTP spawning\n";
}

static CommandResult usage_error(const std::string& synopsis) {
    return {false, "usage: cronkit cron " + synopsis, false};
}

CommandResult dispatch(const ParsedArgs& parsed, CommandContext& ctx) {
    std::vector<std::string> words = parsed.positional;
    if (!words.empty() && words[0] == "cron") words.erase(words.begin());
    if (words.empty()) {
        return {false, "Missing command. See 'cronkit --help'.", false};
    }

    const std::string& group = words[0];
    std::string sub = words.size() > 1 ? words[1] : "";

    if (group == "test") return cmd_cron_test(ctx);

    if (group == "schedule") {
        if (sub == "list") return cmd_schedule_list(ctx, parsed.assoc);
        return usage_error("schedule list [--fields=<fields>] [--format=<format>]");
    }

    if (group == "event") {
        if (sub == "list") return cmd_event_list(ctx, parsed.assoc);
        if (sub == "schedule" || sub == "run" || sub == "delete") {
            if (words.size() < 3) {
                return usage_error("event " + sub + " <hook>");
            }
            const std::string& hook = words[2];
            if (sub == "schedule") return cmd_event_schedule(ctx, hook, parsed.assoc);
            if (sub == "run") return cmd_event_run(ctx, hook);
            return cmd_event_delete(ctx, hook);
        }
        return usage_error("event <list|schedule|run|delete>");
    }

    return {false, "'" + group + "' is not a registered cron subcommand.", false};
}

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    ParsedArgs parsed = parse_args(args);
    if (parsed.help) {
        out << usage_text();
        return 0;
    }

    try {
        Config config = Config::load();
        apply_global_options(parsed.assoc, config);

        auto store = create_event_store(config);
        ScheduleRegistry schedules(config);
        Scheduler scheduler(*store, schedules);
        PlatformHttpClient http;
        CronSpawner spawner(config, *store, http);
        CommandContext ctx{config, *store, scheduler, schedules, spawner, epoch_seconds()};

        CommandResult result = dispatch(parsed, ctx);
        if (!result.success) {
            err << "Error: " << result.output << "\n";
            return 1;
        }
        if (result.listing) {
            out << result.output;
            if (!result.output.empty() && result.output.back() != '\n') out << "\n";
        } else {
            out << "Success: " << result.output << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace cronkit
