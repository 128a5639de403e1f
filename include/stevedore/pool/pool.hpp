/**
 * Supervisor/worker pool.
 *
 * Pool<Job, Payload>::start() spins up `workers` worker threads and one
 * supervisor sharing a work channel and a reply channel, and returns a
 * PoolHandle straight away. The pool runs until its work is exhausted,
 * finalize declares it unrecoverable, or someone calls kill().
 *
 * Usage:
 *   auto handle = Pool<CopyJob, int64_t>::start("copy", 8, items, work, finalize);
 *   handle.join();
 *   auto signals = handle.signals();
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "stevedore/error.hpp"
#include "stevedore/logging.hpp"
#include "stevedore/pool/channel.hpp"
#include "stevedore/pool/finalize.hpp"
#include "stevedore/pool/kill_switch.hpp"
#include "stevedore/pool/signals.hpp"
#include "stevedore/pool/supervisor.hpp"
#include "stevedore/pool/work_item.hpp"
#include "stevedore/pool/worker.hpp"

namespace stevedore::pool {

template<typename Item>
class PoolHandle {
public:
    struct State {
        std::string name;
        KillSwitch kill;
        Channel<Item> work;
        Channel<Item> replies;
        SignalStore<Item> store;

        std::vector<std::thread> threads;
        std::mutex join_mutex;

        std::mutex live_mutex;
        std::condition_variable live_cv;
        size_t live = 0;

        void finished() {
            {
                std::lock_guard<std::mutex> lock(live_mutex);
                --live;
            }
            live_cv.notify_all();
        }
    };

    explicit PoolHandle(std::shared_ptr<State> state) : state_(std::move(state)) {}

    PoolHandle(PoolHandle&&) noexcept = default;
    PoolHandle& operator=(PoolHandle&& other) noexcept {
        if (this != &other) {
            shutdown();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    PoolHandle(const PoolHandle&) = delete;
    PoolHandle& operator=(const PoolHandle&) = delete;

    ~PoolHandle() { shutdown(); }

    const std::string& name() const { return state_->name; }

    // Idempotent. In-flight work finishes; pending work is cancelled.
    void kill() { state_->kill.close(); }

    bool killed() const { return state_->kill.closed(); }

    Signals<Item> signals() const { return state_->store.snapshot(); }

    // Returns true if every pool thread has exited within the timeout.
    bool wait_for(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(state_->live_mutex);
        return state_->live_cv.wait_for(lock, timeout, [this] { return state_->live == 0; });
    }

    void join() {
        std::lock_guard<std::mutex> lock(state_->join_mutex);
        for (auto& t : state_->threads) {
            if (t.joinable()) t.join();
        }
    }

    bool joined() const {
        std::lock_guard<std::mutex> lock(state_->live_mutex);
        return state_->live == 0;
    }

private:
    void shutdown() {
        if (!state_) return;
        kill();
        join();
    }

    std::shared_ptr<State> state_;
};

template<typename Job, typename Payload = Unit>
struct Pool {
    using Item = WorkItem<Job, Payload>;
    using Handle = PoolHandle<Item>;
    using Work = WorkFn<Item>;
    using Finalize = FinalizeFn<Item>;

    /**
     * @brief Start a pool
     * @param name Used in log lines
     * @param workers Number of worker threads (>= 1)
     * @param pending Initial work, dispatched in order
     * @param work Runs one item; throws to report Timeout/Error
     * @param finalize Turns a reply into follow-up work; may be empty
     * @throws InvalidArgumentError if workers < 1
     */
    static Handle start(std::string name, int workers, std::vector<Item> pending,
                        Work work, Finalize finalize) {
        STEVEDORE_CHECK_ARGUMENT(workers >= 1, "pool needs at least one worker");
        STEVEDORE_CHECK_ARGUMENT(static_cast<bool>(work), "pool needs a work function");

        auto state = std::make_shared<typename Handle::State>();
        state->name = std::move(name);
        state->store.update([&pending](Signals<Item>& s) {
            s.enqueued = pending.size();
            for (auto& item : pending) s.pending.push_back(std::move(item));
        });

        auto* raw = state.get();
        state->kill.tap([raw] {
            raw->work.close();
            raw->replies.wake();
        });

        LOG_INFO("[Pool ", state->name, "] Starting ", workers, " workers with ",
                 state->store.snapshot().pending.size(), " pending");

        state->live = static_cast<size_t>(workers) + 1;
        state->threads.reserve(state->live);

        // Workers share the state; the handle keeps it alive until join.
        auto work_fn = std::make_shared<Work>(std::move(work));
        for (int i = 0; i < workers; ++i) {
            state->threads.emplace_back([raw, work_fn, i] {
                run_worker<Item>(raw->name, static_cast<size_t>(i), raw->work, raw->replies, *work_fn);
                raw->finished();
            });
        }

        state->threads.emplace_back([raw, workers, finalize = std::move(finalize)]() mutable {
            Supervisor<Item> supervisor(raw->name, static_cast<size_t>(workers),
                                        raw->work, raw->replies, raw->kill, raw->store,
                                        std::move(finalize));
            supervisor.run();
            raw->finished();
        });

        return Handle(std::move(state));
    }
};

} // namespace stevedore::pool
