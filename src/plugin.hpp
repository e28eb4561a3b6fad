#pragma once
#include "event_store.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace cronkit {

// Factory function type
using StoreFactory = std::function<std::unique_ptr<EventStore>(const Config& config)>;

// Central registry for self-registering store backends.
// All methods are thread-safe.
class StoreRegistry {
public:
    static StoreRegistry& instance();

    void register_store(const std::string& name, StoreFactory factory);

    std::unique_ptr<EventStore> create_store(const std::string& name,
                                             const Config& config) const;

    std::vector<std::string> store_names() const;
    bool has_store(const std::string& name) const;

private:
    StoreRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoreFactory> stores_;
};

// ── Self-registrar helper (used at file scope in each backend .cpp) ──

struct StoreRegistrar {
    StoreRegistrar(const std::string& name, StoreFactory factory) {
        StoreRegistry::instance().register_store(name, std::move(factory));
    }
};

} // namespace cronkit
