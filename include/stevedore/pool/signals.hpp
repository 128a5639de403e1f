#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace stevedore::pool {

enum class ShutdownReason {
    Running,
    Completed,
    Killed,
    Unrecoverable
};

inline const char* shutdown_reason_name(ShutdownReason reason) {
    switch (reason) {
        case ShutdownReason::Running:       return "running";
        case ShutdownReason::Completed:     return "completed";
        case ShutdownReason::Killed:        return "killed";
        case ShutdownReason::Unrecoverable: return "unrecoverable";
    }
    return "unknown";
}

// Estimate only: follow-up work grows the total as the pool runs.
struct Progress {
    size_t pending = 0;
    size_t in_flight = 0;
    size_t landed = 0;
    size_t total = 0;
    double percent = 0.0;
};

/**
 * State a pool shares with the outside world.
 *
 * The supervisor is the only writer. Everyone else reads copies taken
 * through SignalStore::snapshot().
 */
template<typename Item>
struct Signals {
    std::deque<Item> pending;
    size_t in_flight = 0;
    size_t landed = 0;
    size_t enqueued = 0;
    std::vector<Item> failed;
    std::vector<Item> cancelled;
    std::map<std::string, int64_t> counters;
    ShutdownReason reason = ShutdownReason::Running;

    void count(const std::string& key, int64_t delta = 1) {
        counters[key] += delta;
    }

    int64_t counter(const std::string& key) const {
        auto it = counters.find(key);
        return it == counters.end() ? 0 : it->second;
    }

    bool quiescent() const {
        return pending.empty() && in_flight == 0;
    }

    bool conserved() const {
        return pending.size() + in_flight + landed + cancelled.size() == enqueued;
    }

    Progress progress() const {
        Progress p;
        p.pending = pending.size();
        p.in_flight = in_flight;
        p.landed = landed;
        p.total = p.pending + p.in_flight + p.landed;
        p.percent = p.total == 0 ? 100.0 : 100.0 * static_cast<double>(p.landed) / static_cast<double>(p.total);
        return p;
    }

    // Work an operator should resubmit: failures first, then cancellations.
    std::vector<Item> retry_items() const {
        std::vector<Item> items(failed);
        items.insert(items.end(), cancelled.begin(), cancelled.end());
        return items;
    }
};

template<typename Item>
class SignalStore {
public:
    Signals<Item> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return signals_;
    }

    template<typename F>
    auto update(F&& f) {
        std::lock_guard<std::mutex> lock(mutex_);
        return f(signals_);
    }

private:
    Signals<Item> signals_;
    mutable std::mutex mutex_;
};

} // namespace stevedore::pool
