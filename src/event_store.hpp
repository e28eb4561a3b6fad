#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cronkit {

struct Config; // forward declaration

struct EventData {
    std::string schedule;            // empty = non-repeating
    nlohmann::json args = nlohmann::json::array();
    std::optional<int64_t> interval; // seconds, set for repeating events
};

// timestamp -> hook -> signature -> event
using CronArray = std::map<int64_t, std::map<std::string, std::map<std::string, EventData>>>;

struct CronEvent {
    std::string hook;
    int64_t time = 0;
    std::string sig;
    nlohmann::json args = nlohmann::json::array();
    std::string schedule;
    std::optional<int64_t> interval;
};

// Abstract store for the host platform's cron array and transients
class EventStore {
public:
    virtual ~EventStore() = default;

    virtual std::string backend_name() const = 0;

    // Read the whole cron array. Empty when nothing is scheduled.
    virtual CronArray load() = 0;

    // Replace the stored cron array. Returns false if it could not be persisted.
    virtual bool save(const CronArray& crons) = 0;

    virtual std::optional<std::string> get_transient(const std::string& name) = 0;
    virtual bool set_transient(const std::string& name, const std::string& value) = 0;

    // Returns true if the transient existed.
    virtual bool delete_transient(const std::string& name) = 0;
};

// Create the store backend named by config.store (throws on unknown name)
std::unique_ptr<EventStore> create_event_store(const Config& config);

} // namespace cronkit
