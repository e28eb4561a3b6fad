#pragma once
#include <string>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>

namespace cronkit {

struct ScheduleEntry {
    int64_t interval = 0;
    std::string display;
};

struct Config {
    std::string store = "json";     // Event store backend: json or sqlite
    std::string store_path;         // Empty = backend default under ~/.cronkit
    std::string site_url = "http://localhost";
    std::string cron_path = "/wp-cron.php";
    bool alternate_cron = false;    // Dispatcher runs in-process; skip HTTP spawn
    bool ssl_verify = true;
    uint32_t spawn_timeout = 3;     // seconds, test spawn only
    double gmt_offset = 0.0;        // hours, used for the local next_run column

    // Custom recurrence schedules, keyed by name
    std::map<std::string, ScheduleEntry> schedules;

    // Load from ~/.cronkit/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a (merged) config document; unknown or mistyped keys are ignored
    static Config from_json(const nlohmann::json& j);

    // Apply environment variable overrides in place
    void apply_env();

    // Full URL of the dispatcher endpoint (site_url + cron_path)
    std::string cron_url() const;
};

// Path of the config file (~/.cronkit/config.json)
std::string config_path();

} // namespace cronkit
