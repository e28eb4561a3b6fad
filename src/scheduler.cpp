#include "scheduler.hpp"

#include <openssl/evp.h>
#include <cstdio>

namespace cronkit {

std::string event_signature(const nlohmann::json& args) {
    std::string serialized = args.dump();
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(serialized.data(), serialized.size(), digest, &digest_len,
                   EVP_md5(), nullptr) != 1) {
        return {};
    }

    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        hex += buf;
    }
    return hex;
}

Scheduler::Scheduler(EventStore& store, const ScheduleRegistry& schedules)
    : store_(store), schedules_(schedules) {}

std::vector<CronEvent> Scheduler::events() {
    std::vector<CronEvent> result;
    for (const auto& [time, hooks] : store_.load()) {
        for (const auto& [hook, sigs] : hooks) {
            for (const auto& [sig, data] : sigs) {
                CronEvent ev;
                ev.hook = hook;
                ev.time = time;
                ev.sig = sig;
                ev.args = data.args;
                ev.schedule = data.schedule;
                ev.interval = data.interval;
                result.push_back(std::move(ev));
            }
        }
    }
    return result;
}

bool Scheduler::schedule_single_event(int64_t timestamp, const std::string& hook,
                                      const nlohmann::json& args) {
    std::string sig = event_signature(args);
    if (sig.empty()) return false;

    CronArray crons = store_.load();

    // Refuse a duplicate of an identical one-off event close to this time
    for (const auto& [time, hooks] : crons) {
        int64_t diff = time > timestamp ? time - timestamp : timestamp - time;
        if (diff > kDuplicateWindow) continue;
        auto hook_it = hooks.find(hook);
        if (hook_it == hooks.end()) continue;
        auto sig_it = hook_it->second.find(sig);
        if (sig_it != hook_it->second.end() && sig_it->second.schedule.empty()) {
            return false;
        }
    }

    EventData data;
    data.args = args;
    crons[timestamp][hook][sig] = std::move(data);
    return store_.save(crons);
}

bool Scheduler::schedule_event(int64_t timestamp, const std::string& recurrence,
                               const std::string& hook, const nlohmann::json& args) {
    auto schedule = schedules_.find(recurrence);
    if (!schedule) return false;

    std::string sig = event_signature(args);
    if (sig.empty()) return false;

    CronArray crons = store_.load();
    EventData data;
    data.schedule = schedule->name;
    data.args = args;
    data.interval = schedule->interval;
    crons[timestamp][hook][sig] = std::move(data);
    return store_.save(crons);
}

bool Scheduler::unschedule_event(int64_t timestamp, const std::string& hook,
                                 const nlohmann::json& args) {
    return unschedule_signature(timestamp, hook, event_signature(args));
}

bool Scheduler::unschedule_signature(int64_t timestamp, const std::string& hook,
                                     const std::string& sig) {
    CronArray crons = store_.load();

    auto time_it = crons.find(timestamp);
    if (time_it == crons.end()) return false;
    auto hook_it = time_it->second.find(hook);
    if (hook_it == time_it->second.end()) return false;
    if (hook_it->second.erase(sig) == 0) return false;

    // Prune empty levels
    if (hook_it->second.empty()) time_it->second.erase(hook_it);
    if (time_it->second.empty()) crons.erase(time_it);

    return store_.save(crons);
}

bool Scheduler::is_scheduled(int64_t timestamp, const std::string& hook,
                             const std::string& sig) {
    CronArray crons = store_.load();
    auto time_it = crons.find(timestamp);
    if (time_it == crons.end()) return false;
    auto hook_it = time_it->second.find(hook);
    if (hook_it == time_it->second.end()) return false;
    return hook_it->second.count(sig) > 0;
}

std::optional<int64_t> Scheduler::next_scheduled(const std::string& hook,
                                                 const nlohmann::json& args) {
    std::string sig = event_signature(args);
    for (const auto& [time, hooks] : store_.load()) {
        auto hook_it = hooks.find(hook);
        if (hook_it != hooks.end() && hook_it->second.count(sig) > 0) {
            return time;
        }
    }
    return std::nullopt;
}

} // namespace cronkit
