#pragma once

#include <exception>
#include <functional>
#include <string>
#include <utility>

#include "stevedore/error.hpp"
#include "stevedore/logging.hpp"
#include "stevedore/pool/channel.hpp"
#include "stevedore/pool/work_item.hpp"

namespace stevedore::pool {

template<typename Item>
using WorkFn = std::function<typename Item::payload_type(const Item&)>;

/**
 * Run fn on item and return item with its outcome filled in.
 *
 * A StatementTimeout becomes Status::Timeout; any other exception becomes
 * Status::Error carrying the exception message. Nothing escapes.
 */
template<typename Item, typename Fn>
Item run_guarded(Fn&& fn, Item item) {
    try {
        item.outcome.payload = fn(static_cast<const Item&>(item));
        item.outcome.status = Status::Success;
        item.outcome.error.clear();
    } catch (const StatementTimeout& e) {
        item.outcome.status = Status::Timeout;
        item.outcome.error = e.what();
    } catch (const std::exception& e) {
        item.outcome.status = Status::Error;
        item.outcome.error = e.what();
    } catch (...) {
        item.outcome.status = Status::Error;
        item.outcome.error = "unknown exception";
    }
    return item;
}

// Worker thread body: take work until the work channel closes.
template<typename Item>
void run_worker(const std::string& pool, size_t id,
                Channel<Item>& work, Channel<Item>& replies,
                const WorkFn<Item>& fn) {
    LOG_DEBUG("[Worker ", pool, "/", id, "] Starting...");

    while (auto item = work.receive()) {
        Item reply = run_guarded(fn, std::move(*item));
        if (reply.errored()) {
            LOG_DEBUG("[Worker ", pool, "/", id, "] ", reply.label, " failed: ", reply.outcome.error);
        }
        std::string label = reply.label;
        if (!replies.send(std::move(reply))) {
            LOG_WARN("[Worker ", pool, "/", id, "] Supervisor gone, dropping reply for ", label);
        }
    }

    LOG_DEBUG("[Worker ", pool, "/", id, "] ...shutting down.");
}

} // namespace stevedore::pool
