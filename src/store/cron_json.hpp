#pragma once
#include "../event_store.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace cronkit {

// Shared JSON <-> CronArray conversion used by both JsonEventStore and
// SqliteEventStore. Document shape:
//   {"<timestamp>": {"<hook>": {"<sig>": {"schedule": false|"<name>",
//                                         "args": [...], "interval": N}}},
//    "version": 2}

inline constexpr int kCronArrayVersion = 2;

inline EventData event_data_from_json(const nlohmann::json& item) {
    EventData data;
    if (!item.is_object()) return data;
    if (item.contains("schedule") && item["schedule"].is_string())
        data.schedule = item["schedule"].get<std::string>();
    if (item.contains("args") && (item["args"].is_array() || item["args"].is_object()))
        data.args = item["args"];
    if (item.contains("interval") && item["interval"].is_number_integer())
        data.interval = item["interval"].get<int64_t>();
    return data;
}

inline nlohmann::json event_data_to_json(const EventData& data) {
    nlohmann::json item = {
        {"schedule", data.schedule.empty() ? nlohmann::json(false)
                                           : nlohmann::json(data.schedule)},
        {"args", data.args}
    };
    if (data.interval) {
        item["interval"] = *data.interval;
    }
    return item;
}

inline CronArray cron_array_from_json(const nlohmann::json& doc) {
    CronArray crons;
    if (!doc.is_object()) return crons;

    for (auto& [ts_key, hooks] : doc.items()) {
        if (!is_digits(ts_key) || !hooks.is_object()) continue; // "version"
        int64_t ts = 0;
        try {
            ts = std::stoll(ts_key);
        } catch (const std::out_of_range&) {
            continue;
        }
        for (auto& [hook, sigs] : hooks.items()) {
            if (!sigs.is_object()) continue;
            for (auto& [sig, item] : sigs.items()) {
                crons[ts][hook][sig] = event_data_from_json(item);
            }
        }
    }
    return crons;
}

inline nlohmann::json cron_array_to_json(const CronArray& crons) {
    nlohmann::json doc = nlohmann::json::object();
    for (const auto& [ts, hooks] : crons) {
        nlohmann::json hooks_json = nlohmann::json::object();
        for (const auto& [hook, sigs] : hooks) {
            nlohmann::json sigs_json = nlohmann::json::object();
            for (const auto& [sig, data] : sigs) {
                sigs_json[sig] = event_data_to_json(data);
            }
            hooks_json[hook] = std::move(sigs_json);
        }
        doc[std::to_string(ts)] = std::move(hooks_json);
    }
    doc["version"] = kCronArrayVersion;
    return doc;
}

} // namespace cronkit
