/**
 * Blocking message channel between pool threads.
 *
 * Unbounded FIFO guarded by a mutex and condition variable. Once closed,
 * senders are refused and receivers return empty even if messages are still
 * buffered; whoever closed it collects the leftovers with drain().
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace stevedore::pool {

template<typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false if the channel is closed.
    bool send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until a message arrives or the channel closes.
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return pop_locked();
    }

    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    // Blocks until a message arrives, the channel closes, or interrupted()
    // turns true. interrupted() is evaluated under the channel lock, so the
    // caller must wake() after changing whatever it observes.
    std::optional<T> receive_unless(const std::function<bool()>& interrupted) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return closed_ || !queue_.empty() || interrupted(); });
        return pop_locked();
    }

    // Take everything still buffered, open or closed.
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(queue_.size());
        for (auto& v : queue_) out.push_back(std::move(v));
        queue_.clear();
        return out;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    void wake() {
        { std::lock_guard<std::mutex> lock(mutex_); }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> pop_locked() {
        if (closed_ || queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    std::deque<T> queue_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace stevedore::pool
