#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace cronkit {

StoreRegistry& StoreRegistry::instance() {
    static StoreRegistry registry;
    return registry;
}

void StoreRegistry::register_store(const std::string& name, StoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    stores_[name] = std::move(factory);
}

std::unique_ptr<EventStore> StoreRegistry::create_store(const std::string& name,
                                                        const Config& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stores_.find(name);
    if (it == stores_.end()) {
        throw std::invalid_argument("Unknown store backend: " + name);
    }
    return it->second(config);
}

std::vector<std::string> StoreRegistry::store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(stores_.size());
    for (const auto& [name, _] : stores_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool StoreRegistry::has_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.count(name) > 0;
}

std::unique_ptr<EventStore> create_event_store(const Config& config) {
    return StoreRegistry::instance().create_store(config.store, config);
}

} // namespace cronkit
