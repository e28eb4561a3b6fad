#pragma once
#include "../event_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace cronkit {

// Host-style options table: the cron array is the JSON value of option
// "cron", transients are options named "_transient_<name>".
class SqliteEventStore : public EventStore {
public:
    explicit SqliteEventStore(const std::string& path);
    ~SqliteEventStore() override;

    // Non-copyable
    SqliteEventStore(const SqliteEventStore&) = delete;
    SqliteEventStore& operator=(const SqliteEventStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    CronArray load() override;
    bool save(const CronArray& crons) override;

    std::optional<std::string> get_transient(const std::string& name) override;
    bool set_transient(const std::string& name, const std::string& value) override;
    bool delete_transient(const std::string& name) override;

private:
    void init_schema();
    std::optional<std::string> get_option(const std::string& name);
    bool set_option(const std::string& name, const std::string& value);
    bool delete_option(const std::string& name);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace cronkit
