#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace cronkit {

std::string config_path() {
    return expand_home("~/.cronkit/config.json");
}

nlohmann::json Config::defaults_json() {
    return {
        {"store", "json"},
        {"store_path", ""},
        {"site_url", "http://localhost"},
        {"cron_path", "/wp-cron.php"},
        {"alternate_cron", false},
        {"ssl_verify", true},
        {"spawn_timeout", 3},
        {"gmt_offset", 0},
        {"schedules", nlohmann::json::object()}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("store") && j["store"].is_string())
        cfg.store = j["store"].get<std::string>();
    if (j.contains("store_path") && j["store_path"].is_string())
        cfg.store_path = j["store_path"].get<std::string>();
    if (j.contains("site_url") && j["site_url"].is_string())
        cfg.site_url = j["site_url"].get<std::string>();
    if (j.contains("cron_path") && j["cron_path"].is_string())
        cfg.cron_path = j["cron_path"].get<std::string>();
    if (j.contains("alternate_cron") && j["alternate_cron"].is_boolean())
        cfg.alternate_cron = j["alternate_cron"].get<bool>();
    if (j.contains("ssl_verify") && j["ssl_verify"].is_boolean())
        cfg.ssl_verify = j["ssl_verify"].get<bool>();
    if (j.contains("spawn_timeout") && j["spawn_timeout"].is_number_integer() &&
        j["spawn_timeout"].get<int64_t>() > 0)
        cfg.spawn_timeout = j["spawn_timeout"].get<uint32_t>();
    if (j.contains("gmt_offset") && j["gmt_offset"].is_number())
        cfg.gmt_offset = j["gmt_offset"].get<double>();

    if (j.contains("schedules") && j["schedules"].is_object()) {
        for (auto& [name, obj] : j["schedules"].items()) {
            if (!obj.is_object()) continue;
            ScheduleEntry entry;
            if (obj.contains("interval") && obj["interval"].is_number_integer())
                entry.interval = obj["interval"].get<int64_t>();
            if (obj.contains("display") && obj["display"].is_string())
                entry.display = obj["display"].get<std::string>();
            cfg.schedules[name] = std::move(entry);
        }
    }
    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("CRONKIT_STORE"))
        store = v;
    if (const char* v = std::getenv("CRONKIT_STORE_PATH"))
        store_path = v;
    if (const char* v = std::getenv("CRONKIT_SITE_URL"))
        site_url = v;
    if (const char* v = std::getenv("CRONKIT_GMT_OFFSET")) {
        try {
            gmt_offset = std::stod(v);
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid CRONKIT_GMT_OFFSET: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("ALTERNATE_WP_CRON")) {
        std::string flag = to_lower(v);
        alternate_cron = (flag == "1" || flag == "true" || flag == "yes");
    }
}

Config Config::load() {
    std::string path = config_path();
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << path << "\n";
                } else {
                    std::cerr << "[config] Warning: failed to write migrated config "
                              << path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);
    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

std::string Config::cron_url() const {
    std::string base = site_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string path = cron_path;
    if (path.empty() || path[0] != '/') path = "/" + path;
    return base + path;
}

} // namespace cronkit
