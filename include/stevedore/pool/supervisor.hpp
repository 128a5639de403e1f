#pragma once

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "stevedore/logging.hpp"
#include "stevedore/pool/channel.hpp"
#include "stevedore/pool/finalize.hpp"
#include "stevedore/pool/kill_switch.hpp"
#include "stevedore/pool/signals.hpp"

namespace stevedore::pool {

/**
 * Single owner of a pool's Signals.
 *
 * Offers pending work to workers while fewer than `workers` items are in
 * flight, feeds every reply through finalize, and shuts the pool down on
 * quiescence, on an external kill, or when finalize gives up.
 *
 * Shutdown rules:
 *  - quiescence: closes the kill switch, reason Completed
 *  - external kill: pending and undelivered work move to `cancelled`,
 *    in-flight replies are still drained (their follow-ups are cancelled)
 *  - unrecoverable (or finalize throws): closes the kill switch and stops
 *    at once, without waiting for in-flight work
 */
template<typename Item>
class Supervisor {
public:
    Supervisor(std::string name, size_t workers,
               Channel<Item>& work, Channel<Item>& replies,
               KillSwitch& kill, SignalStore<Item>& store,
               FinalizeFn<Item> finalize)
        : name_(std::move(name))
        , workers_(workers)
        , work_(work)
        , replies_(replies)
        , kill_(kill)
        , store_(store)
        , finalize_(std::move(finalize)) {}

    void run() {
        log_info("Starting...");

        while (true) {
            if (!shutting_down_) {
                bool done = store_.update([](Signals<Item>& s) {
                    if (s.quiescent() && s.reason == ShutdownReason::Running) {
                        s.reason = ShutdownReason::Completed;
                        return true;
                    }
                    return false;
                });
                if (done) {
                    log_info("No more work.");
                    kill_.close();
                }
            }

            if (!shutting_down_ && kill_.closed()) {
                begin_shutdown();
            }

            if (shutting_down_ && store_.update([](Signals<Item>& s) { return s.in_flight == 0; })) {
                break;
            }

            if (!shutting_down_) {
                bool dispatched = dispatch_one();
                if (auto reply = replies_.try_receive()) {
                    if (!handle_reply(std::move(*reply))) break;
                    continue;
                }
                if (dispatched) continue;
            }

            auto reply = replies_.receive_unless([this] {
                return !shutting_down_ && kill_.closed();
            });
            if (reply) {
                if (!handle_reply(std::move(*reply))) break;
            }
        }

        replies_.close();

        auto s = store_.snapshot();
        log_info("Finished (", shutdown_reason_name(s.reason), "): landed=", s.landed,
                 " failed=", s.failed.size(), " cancelled=", s.cancelled.size());
    }

private:
    template<typename... Args>
    void log_info(Args&&... args) {
        LOG_INFO("[Supervisor ", name_, "] ", std::forward<Args>(args)...);
    }

    // Offer the head of the queue to a worker if there is capacity.
    bool dispatch_one() {
        std::optional<Item> next = store_.update([this](Signals<Item>& s) -> std::optional<Item> {
            if (s.pending.empty() || s.in_flight >= workers_) return std::nullopt;
            Item item = std::move(s.pending.front());
            s.pending.pop_front();
            ++s.in_flight;
            return item;
        });
        if (!next) return false;

        LOG_DEBUG("[Supervisor ", name_, "] -> ", *next);
        if (!work_.send(*next)) {
            // Killed between pop and send: put it back so shutdown cancels it.
            store_.update([&next](Signals<Item>& s) {
                --s.in_flight;
                s.pending.push_front(std::move(*next));
            });
            return false;
        }
        return true;
    }

    void begin_shutdown() {
        shutting_down_ = true;
        cancel_outstanding(ShutdownReason::Killed);
        auto s = store_.snapshot();
        log_info("...shutting down, ", s.in_flight, " in flight, ", s.cancelled.size(), " cancelled.");
    }

    // Move queued and undelivered work into `cancelled`.
    void cancel_outstanding(ShutdownReason reason) {
        std::vector<Item> stranded = work_.drain();
        store_.update([&](Signals<Item>& s) {
            if (s.reason == ShutdownReason::Running) s.reason = reason;
            s.in_flight -= stranded.size();
            for (auto& item : s.pending) s.cancelled.push_back(std::move(item));
            s.pending.clear();
            for (auto& item : stranded) s.cancelled.push_back(std::move(item));
        });
    }

    // Returns false when the pool must stop immediately.
    bool handle_reply(Item reply) {
        LOG_DEBUG("[Supervisor ", name_, "] <- ", reply);

        bool unrecoverable = false;
        store_.update([&](Signals<Item>& s) {
            --s.in_flight;
            ++s.landed;

            Followups<Item> add;
            try {
                add = finalize_ ? finalize_(reply, s) : Followups<Item>::none();
            } catch (const std::exception& e) {
                LOG_ERROR("[Supervisor ", name_, "] finalize failed on ", reply.label, ": ", e.what());
                add = Followups<Item>::unrecoverable();
            } catch (...) {
                LOG_ERROR("[Supervisor ", name_, "] finalize failed on ", reply.label, ": unknown exception");
                add = Followups<Item>::unrecoverable();
            }

            if (add.is_unrecoverable()) {
                unrecoverable = true;
                s.failed.push_back(reply);
                return;
            }

            if (add.is_failed() || (reply.errored() && add.items.empty())) {
                LOG_WARN("[Supervisor ", name_, "] Giving up on ", reply);
                s.failed.push_back(reply);
            }

            if (!add.items.empty()) {
                LOG_DEBUG("[Supervisor ", name_, "] ++ ", add.items.size(), " follow-up(s) from ", reply.label);
            }
            for (auto& item : add.items) {
                ++s.enqueued;
                if (shutting_down_) {
                    s.cancelled.push_back(std::move(item));
                } else {
                    s.pending.push_back(std::move(item));
                }
            }
        });

        if (unrecoverable) {
            LOG_ERROR("[Supervisor ", name_, "] Unrecoverable error!");
            shutting_down_ = true;
            kill_.close();
            cancel_outstanding(ShutdownReason::Unrecoverable);
            return false;
        }
        return true;
    }

    std::string name_;
    size_t workers_;
    Channel<Item>& work_;
    Channel<Item>& replies_;
    KillSwitch& kill_;
    SignalStore<Item>& store_;
    FinalizeFn<Item> finalize_;
    bool shutting_down_ = false;
};

} // namespace stevedore::pool
