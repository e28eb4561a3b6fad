#pragma once
#include <cstdint>
#include <string>

namespace cronkit {

struct Config;
class EventStore;
class HttpClient;

// Outcome of a dispatcher reachability check
struct SpawnStatus {
    bool ok = false;
    std::string code;     // "http_request_failed" | "unexpected_http_response"
    std::string message;
};

// Triggers the host's background job dispatcher over HTTP.
class CronSpawner {
public:
    // Name of the lock transient that marks a spawn in progress
    static constexpr const char* kLockName = "doing_cron";
    // A lock younger than this blocks another spawn
    static constexpr int64_t kLockTimeout = 60;

    CronSpawner(const Config& config, EventStore& store, HttpClient& http);

    // Blocking request against the dispatcher endpoint; reports why it failed.
    SpawnStatus test_spawn();

    // Fire-and-forget spawn as the host does it on page load. Returns true
    // when a request was sent and answered.
    bool spawn(int64_t now);

    // Dispatcher URL carrying the given lock key
    std::string spawn_url(const std::string& key) const;

private:
    const Config& config_;
    EventStore& store_;
    HttpClient& http_;
};

// Lock key as the host formats it: seconds with 22 decimals
std::string make_lock_key(double seconds);

} // namespace cronkit
