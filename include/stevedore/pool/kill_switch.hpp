#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace stevedore::pool {

/**
 * Close-once broadcast signal shared by a pool's supervisor, its workers and
 * the handle given to the caller.
 *
 * close() is idempotent. Taps registered with tap() run exactly once, on the
 * thread that first closes the switch, outside the internal lock. A tap added
 * after closing runs immediately on the caller's thread.
 */
class KillSwitch {
public:
    using Tap = std::function<void()>;

    KillSwitch() : closed_(false) {}
    KillSwitch(const KillSwitch&) = delete;
    KillSwitch& operator=(const KillSwitch&) = delete;

    // Returns true if this call closed the switch.
    bool close();

    bool closed() const {
        return closed_.load(std::memory_order_acquire);
    }

    void tap(Tap fn);

    // Returns true if closed before the timeout elapsed.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> closed_;
    std::vector<Tap> taps_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace stevedore::pool
