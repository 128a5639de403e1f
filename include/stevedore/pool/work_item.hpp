#pragma once

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace stevedore::pool {

enum class Status {
    Pending,
    Success,
    Timeout,
    Error
};

inline const char* status_name(Status status) {
    switch (status) {
        case Status::Pending: return "pending";
        case Status::Success: return "success";
        case Status::Timeout: return "timeout";
        case Status::Error:   return "error";
    }
    return "unknown";
}

// Payload for work whose only result is "it ran".
struct Unit {};

template<typename Payload>
struct Outcome {
    Status status = Status::Pending;
    std::optional<Payload> payload;
    std::string error;
};

/**
 * One unit of work travelling between supervisor and workers.
 *
 * Items are values: workers receive a copy and send back a copy with the
 * outcome filled in. Follow-up work is derived from a reply with
 * followup(), which clears the outcome.
 */
template<typename Job, typename Payload = Unit>
struct WorkItem {
    using job_type = Job;
    using payload_type = Payload;

    Job job{};
    std::string label;
    int retries = 0;
    std::chrono::milliseconds timeout{0};
    int escalations = 0;
    Outcome<Payload> outcome;

    static WorkItem make(Job job, std::string label, int retries, std::chrono::milliseconds timeout) {
        WorkItem item;
        item.job = std::move(job);
        item.label = std::move(label);
        item.retries = retries;
        item.timeout = timeout;
        return item;
    }

    bool succeeded() const { return outcome.status == Status::Success; }
    bool timed_out() const { return outcome.status == Status::Timeout; }
    bool errored() const { return outcome.status == Status::Error; }

    WorkItem followup() const {
        WorkItem next = *this;
        next.outcome = Outcome<Payload>{};
        return next;
    }
};

template<typename Job, typename Payload>
std::ostream& operator<<(std::ostream& os, const WorkItem<Job, Payload>& item) {
    os << item.label << " {retries=" << item.retries
       << ", timeout=" << item.timeout.count() << "ms";
    if (item.escalations > 0) os << ", escalations=" << item.escalations;
    if (item.outcome.status != Status::Pending) os << ", status=" << status_name(item.outcome.status);
    if (!item.outcome.error.empty()) os << ", error=" << item.outcome.error;
    return os << "}";
}

} // namespace stevedore::pool
