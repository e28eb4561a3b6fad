#include "dispatcher.hpp"
#include "config.hpp"
#include "event_store.hpp"
#include "http.hpp"
#include "util.hpp"
#include <cstdio>
#include <iostream>

namespace cronkit {

std::string make_lock_key(double seconds) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.22f", seconds);
    return buf;
}

CronSpawner::CronSpawner(const Config& config, EventStore& store, HttpClient& http)
    : config_(config), store_(store), http_(http) {}

std::string CronSpawner::spawn_url(const std::string& key) const {
    return config_.cron_url() + "?doing_wp_cron=" + key;
}

SpawnStatus CronSpawner::test_spawn() {
    SpawnStatus status;
    if (config_.alternate_cron) {
        status.ok = true;
        return status;
    }

    std::string url = spawn_url(make_lock_key(epoch_seconds_precise()));
    auto response = http_.post(url, "", {}, static_cast<long>(config_.spawn_timeout),
                               config_.ssl_verify);

    if (response.status_code == 0) {
        status.code = "http_request_failed";
        status.message = response.error.empty() ? "HTTP request failed" : response.error;
        return status;
    }
    if (response.status_code >= 300) {
        status.code = "unexpected_http_response";
        status.message = "Unexpected HTTP response code: " +
                         std::to_string(response.status_code);
        return status;
    }

    status.ok = true;
    return status;
}

bool CronSpawner::spawn(int64_t now) {
    if (config_.alternate_cron) return false;

    auto lock = store_.get_transient(kLockName);
    if (lock) {
        int64_t locked_at = 0;
        try {
            locked_at = static_cast<int64_t>(std::stod(*lock));
        } catch (const std::exception&) {
            locked_at = 0;
        }
        if (locked_at + kLockTimeout > now) {
            std::cerr << "[spawn] Dispatcher already running, skipping\n";
            return false;
        }
    }

    // Nothing due yet
    auto crons = store_.load();
    if (crons.empty() || crons.begin()->first > now) return false;

    std::string key = make_lock_key(static_cast<double>(now));
    if (!store_.set_transient(kLockName, key)) {
        std::cerr << "[spawn] Failed to set the dispatcher lock\n";
        return false;
    }

    auto response = http_.post(spawn_url(key), "", {}, 1, config_.ssl_verify);
    if (response.status_code == 0) {
        std::cerr << "[spawn] Request failed: " << response.error << "\n";
        return false;
    }
    return true;
}

} // namespace cronkit
