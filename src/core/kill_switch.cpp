#include "stevedore/pool/kill_switch.hpp"

namespace stevedore::pool {

bool KillSwitch::close() {
    std::vector<Tap> taps;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.load(std::memory_order_acquire)) return false;
        closed_.store(true, std::memory_order_release);
        taps.swap(taps_);
    }
    cv_.notify_all();

    for (auto& fn : taps) {
        fn();
    }
    return true;
}

void KillSwitch::tap(Tap fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_.load(std::memory_order_acquire)) {
            taps_.push_back(std::move(fn));
            return;
        }
    }
    fn();
}

bool KillSwitch::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return closed_.load(std::memory_order_acquire); });
}

} // namespace stevedore::pool
