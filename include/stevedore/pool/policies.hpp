/**
 * Finalize building blocks.
 *
 * - Deadline escalation: a timed-out item is retried with a longer
 *   statement timeout, optionally up to max_escalations times.
 * - Bounded retry: an errored item is retried while its retry budget lasts.
 * - Range splitting: a timed-out [lo, hi) item is halved; a single-key range
 *   falls back to deadline escalation.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include "stevedore/logging.hpp"
#include "stevedore/pool/finalize.hpp"
#include "stevedore/pool/signals.hpp"

namespace stevedore::pool {

struct RetryPolicy {
    int retries = 3;
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds timeout_step{60000};
    int max_escalations = 0;  // 0 = unbounded
};

// Same item, longer deadline. Empty once the escalation ceiling is reached.
template<typename Item>
std::optional<Item> escalate_deadline(const Item& reply, const RetryPolicy& policy) {
    if (policy.max_escalations > 0 && reply.escalations >= policy.max_escalations) {
        return std::nullopt;
    }
    Item next = reply.followup();
    next.timeout += policy.timeout_step;
    next.escalations += 1;
    return next;
}

// Same item, one fewer retry. Empty once the budget is spent.
template<typename Item>
std::optional<Item> retry_on_error(const Item& reply) {
    if (reply.retries - 1 < 0) {
        return std::nullopt;
    }
    Item next = reply.followup();
    next.retries -= 1;
    return next;
}

// Midpoint of [lo, hi), or empty when the range cannot be split.
inline std::optional<int64_t> split_point(int64_t lo, int64_t hi) {
    if (hi - lo <= 1) return std::nullopt;
    return lo + (hi - lo) / 2;
}

// Timeout/Error handling shared by every policy.
template<typename Item>
Followups<Item> escalate_or_retry(const Item& reply, const RetryPolicy& policy) {
    if (reply.timed_out()) {
        if (auto next = escalate_deadline(reply, policy)) {
            LOG_DEBUG("Escalating ", reply.label, " to ", next->timeout.count(), "ms");
            return Followups<Item>::retry(std::move(*next));
        }
        LOG_WARN("Escalation ceiling reached for ", reply.label);
        return Followups<Item>::failed();
    }
    if (reply.errored()) {
        if (auto next = retry_on_error(reply)) {
            return Followups<Item>::retry(std::move(*next));
        }
    }
    return Followups<Item>::none();
}

template<typename Item>
using SuccessFn = std::function<Followups<Item>(const Item& reply, Signals<Item>& signals)>;

template<typename Item>
FinalizeFn<Item> deadline_escalation(RetryPolicy policy, SuccessFn<Item> on_success = {}) {
    return [policy, on_success = std::move(on_success)](const Item& reply, Signals<Item>& signals) {
        if (reply.succeeded()) {
            return on_success ? on_success(reply, signals) : Followups<Item>::none();
        }
        return escalate_or_retry(reply, policy);
    };
}

// Job must expose int64_t lo and hi describing a half-open key range.
template<typename Item>
FinalizeFn<Item> range_splitting(RetryPolicy policy, SuccessFn<Item> on_success = {}) {
    return [policy, on_success = std::move(on_success)](const Item& reply, Signals<Item>& signals) {
        if (reply.succeeded()) {
            return on_success ? on_success(reply, signals) : Followups<Item>::none();
        }
        if (reply.timed_out()) {
            if (auto mid = split_point(reply.job.lo, reply.job.hi)) {
                Item left = reply.followup();
                Item right = reply.followup();
                left.job.hi = *mid;
                right.job.lo = *mid;
                LOG_DEBUG("Splitting ", reply.label, " at ", *mid);
                return Followups<Item>::of({std::move(left), std::move(right)});
            }
        }
        return escalate_or_retry(reply, policy);
    };
}

} // namespace stevedore::pool
