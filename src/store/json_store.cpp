#include "json_store.hpp"
#include "cron_json.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <fstream>
#include <iostream>

static cronkit::StoreRegistrar reg_json("json",
    [](const cronkit::Config& config) {
        std::string path = config.store_path;
        if (path.empty()) {
            path = cronkit::expand_home("~/.cronkit/cron.json");
        }
        return std::make_unique<cronkit::JsonEventStore>(path);
    });

namespace cronkit {

JsonEventStore::JsonEventStore(const std::string& path) : path_(path) {}

nlohmann::json JsonEventStore::read_document() const {
    std::ifstream file(path_);
    if (!file.is_open()) return nlohmann::json::object();

    try {
        nlohmann::json doc = nlohmann::json::parse(file);
        if (doc.is_object()) return doc;
        std::cerr << "[store] Ignoring non-object document in " << path_ << "\n";
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[store] Corrupt store file " << path_ << ": " << e.what() << "\n";
    }
    return nlohmann::json::object();
}

bool JsonEventStore::write_document(const nlohmann::json& doc) const {
    if (!atomic_write_file(path_, doc.dump(2) + "\n")) {
        std::cerr << "[store] Warning: failed to persist " << path_ << "\n";
        return false;
    }
    return true;
}

CronArray JsonEventStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json doc = read_document();
    if (!doc.contains("cron")) return {};
    return cron_array_from_json(doc["cron"]);
}

bool JsonEventStore::save(const CronArray& crons) {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json doc = read_document();
    doc["cron"] = cron_array_to_json(crons);
    return write_document(doc);
}

std::optional<std::string> JsonEventStore::get_transient(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json doc = read_document();
    if (!doc.contains("transients") || !doc["transients"].is_object()) return std::nullopt;
    auto& transients = doc["transients"];
    if (!transients.contains(name) || !transients[name].is_string()) return std::nullopt;
    return transients[name].get<std::string>();
}

bool JsonEventStore::set_transient(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json doc = read_document();
    if (!doc.contains("transients") || !doc["transients"].is_object()) {
        doc["transients"] = nlohmann::json::object();
    }
    doc["transients"][name] = value;
    return write_document(doc);
}

bool JsonEventStore::delete_transient(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json doc = read_document();
    if (!doc.contains("transients") || !doc["transients"].is_object()) return false;
    if (doc["transients"].erase(name) == 0) return false;
    return write_document(doc);
}

} // namespace cronkit
