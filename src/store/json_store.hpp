#pragma once
#include "../event_store.hpp"
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace cronkit {

// Cron array and transients kept in a single JSON document:
//   {"cron": {...cron array...}, "transients": {"<name>": "<value>"}}
class JsonEventStore : public EventStore {
public:
    explicit JsonEventStore(const std::string& path);

    std::string backend_name() const override { return "json"; }

    CronArray load() override;
    bool save(const CronArray& crons) override;

    std::optional<std::string> get_transient(const std::string& name) override;
    bool set_transient(const std::string& name, const std::string& value) override;
    bool delete_transient(const std::string& name) override;

private:
    nlohmann::json read_document() const;
    bool write_document(const nlohmann::json& doc) const;

    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace cronkit
