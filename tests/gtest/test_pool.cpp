// =============================================================================
// Supervisor/Worker Pool Tests
// =============================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "fake_executor.hpp"
#include "stevedore/error.hpp"
#include "stevedore/pool/policies.hpp"
#include "stevedore/pool/pool.hpp"

using namespace stevedore;
using namespace stevedore::pool;
using namespace std::chrono_literals;

namespace {

struct NumberJob {
    int n = 0;
};

using NumberPool = Pool<NumberJob, int>;
using NumberItem = NumberPool::Item;

std::vector<NumberItem> numbers(int count, int retries = 0) {
    std::vector<NumberItem> items;
    for (int i = 0; i < count; ++i) {
        items.push_back(NumberItem::make(NumberJob{i}, "n" + std::to_string(i), retries, 1000ms));
    }
    return items;
}

// Holds workers inside the work function until released.
class Gate {
public:
    void enter() {
        std::unique_lock<std::mutex> lock(mutex_);
        ++entered_;
        cv_.wait(lock, [this] { return open_; });
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    int entered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entered_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int entered_ = 0;
    bool open_ = false;
};

} // anonymous namespace

class PoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_level(LogLevel::WARN);
    }
};

// =============================================================================
// Completion and accounting
// =============================================================================

TEST_F(PoolTest, CompletesAllWork) {
    std::atomic<int> sum{0};
    auto handle = NumberPool::start("sum", 4, numbers(50),
        [&](const NumberItem& item) {
            sum += item.job.n;
            return item.job.n;
        },
        {});
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(s.reason, ShutdownReason::Completed);
    EXPECT_EQ(s.landed, 50u);
    EXPECT_EQ(s.enqueued, 50u);
    EXPECT_TRUE(s.quiescent());
    EXPECT_TRUE(s.conserved());
    EXPECT_TRUE(s.failed.empty());
    EXPECT_TRUE(s.cancelled.empty());
    EXPECT_EQ(sum.load(), 49 * 50 / 2);
    EXPECT_TRUE(handle.killed());
    EXPECT_TRUE(handle.joined());
}

TEST_F(PoolTest, EmptyPoolCompletesImmediately) {
    auto handle = NumberPool::start("empty", 2, {}, [](const NumberItem&) { return 0; }, {});
    ASSERT_TRUE(handle.wait_for(5s));
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(s.reason, ShutdownReason::Completed);
    EXPECT_EQ(s.landed, 0u);
    EXPECT_DOUBLE_EQ(s.progress().percent, 100.0);
}

TEST_F(PoolTest, ConservationHoldsWhileRunning) {
    Gate gate;
    auto handle = NumberPool::start("conserve", 3, numbers(20),
        [&](const NumberItem& item) {
            if (item.job.n < 3) gate.enter();
            return item.job.n;
        },
        {});

    ASSERT_TRUE(test::wait_until([&] { return gate.entered() == 3; }));
    for (int i = 0; i < 20; ++i) {
        auto s = handle.signals();
        EXPECT_TRUE(s.conserved());
        EXPECT_LE(s.in_flight, 3u);
    }
    gate.open();
    handle.join();

    auto s = handle.signals();
    EXPECT_TRUE(s.conserved());
    EXPECT_EQ(s.landed, 20u);
}

TEST_F(PoolTest, ConcurrencyNeverExceedsWorkers) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    auto handle = NumberPool::start("bounded", 3, numbers(30),
        [&](const NumberItem& item) {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(2ms);
            --running;
            return item.job.n;
        },
        {});
    handle.join();

    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(handle.signals().landed, 30u);
}

TEST_F(PoolTest, FollowupsAreEnqueuedAndCounted) {
    // Each n > 0 spawns n-1 until the chain bottoms out.
    auto finalize = [](const NumberItem& reply, Signals<NumberItem>& s) {
        s.count("seen");
        if (reply.job.n == 0) return Followups<NumberItem>::none();
        NumberItem next = reply.followup();
        next.job.n -= 1;
        return Followups<NumberItem>::retry(next);
    };

    std::vector<NumberItem> start;
    start.push_back(NumberItem::make(NumberJob{4}, "chain", 0, 1000ms));
    auto handle = NumberPool::start("chain", 2, start, [](const NumberItem& i) { return i.job.n; }, finalize);
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(s.enqueued, 5u);
    EXPECT_EQ(s.landed, 5u);
    EXPECT_EQ(s.counter("seen"), 5);
    EXPECT_TRUE(s.conserved());
}

// =============================================================================
// Retry and failure
// =============================================================================

TEST_F(PoolTest, ErrorRetriesThenFails) {
    std::atomic<int> attempts{0};
    RetryPolicy policy;
    policy.retries = 3;

    auto handle = NumberPool::start("flaky", 2, numbers(1, policy.retries),
        [&](const NumberItem&) -> int {
            ++attempts;
            throw std::runtime_error("always broken");
        },
        deadline_escalation<NumberItem>(policy));
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(attempts.load(), 4);
    ASSERT_EQ(s.failed.size(), 1u);
    EXPECT_EQ(s.failed[0].retries, 0);
    EXPECT_EQ(s.failed[0].outcome.error, "always broken");
    EXPECT_EQ(s.landed, 4u);
    EXPECT_EQ(s.reason, ShutdownReason::Completed);
    EXPECT_TRUE(s.conserved());
}

TEST_F(PoolTest, TransientErrorRecovers) {
    std::atomic<int> attempts{0};
    RetryPolicy policy;
    policy.retries = 3;

    auto handle = NumberPool::start("transient", 1, numbers(1, policy.retries),
        [&](const NumberItem& item) -> int {
            if (++attempts < 3) throw DatabaseError("connection reset");
            return item.job.n;
        },
        deadline_escalation<NumberItem>(policy));
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(attempts.load(), 3);
    EXPECT_TRUE(s.failed.empty());
    EXPECT_EQ(s.landed, 3u);
}

TEST_F(PoolTest, TimeoutsEscalateUntilSuccess) {
    std::vector<std::chrono::milliseconds> deadlines;
    std::mutex mutex;
    RetryPolicy policy;
    policy.timeout = 100ms;
    policy.timeout_step = 100ms;

    std::vector<NumberItem> start;
    start.push_back(NumberItem::make(NumberJob{1}, "slow", 0, policy.timeout));

    auto handle = NumberPool::start("slow", 1, start,
        [&](const NumberItem& item) -> int {
            std::lock_guard<std::mutex> lock(mutex);
            deadlines.push_back(item.timeout);
            if (item.timeout < 300ms) throw StatementTimeout("canceling statement due to statement timeout");
            return 1;
        },
        deadline_escalation<NumberItem>(policy));
    handle.join();

    ASSERT_EQ(deadlines.size(), 3u);
    EXPECT_EQ(deadlines[0], 100ms);
    EXPECT_EQ(deadlines[1], 200ms);
    EXPECT_EQ(deadlines[2], 300ms);
    EXPECT_TRUE(handle.signals().failed.empty());
}

TEST_F(PoolTest, EscalationCeilingFailsItem) {
    RetryPolicy policy;
    policy.timeout = 10ms;
    policy.timeout_step = 10ms;
    policy.max_escalations = 2;

    auto handle = NumberPool::start("ceiling", 1, numbers(1),
        [](const NumberItem&) -> int { throw StatementTimeout("canceling statement due to statement timeout"); },
        deadline_escalation<NumberItem>(policy));
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(s.landed, 3u);
    ASSERT_EQ(s.failed.size(), 1u);
    EXPECT_EQ(s.failed[0].escalations, 2);
    EXPECT_TRUE(s.failed[0].timed_out());
    EXPECT_EQ(s.reason, ShutdownReason::Completed);
}

// =============================================================================
// Shutdown
// =============================================================================

TEST_F(PoolTest, KillCancelsPendingWork) {
    Gate gate;
    auto handle = NumberPool::start("kill", 5, numbers(15),
        [&](const NumberItem& item) {
            gate.enter();
            return item.job.n;
        },
        {});

    ASSERT_TRUE(test::wait_until([&] { return gate.entered() == 5; }));
    handle.kill();
    gate.open();
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(s.reason, ShutdownReason::Killed);
    EXPECT_EQ(s.landed, 5u);
    EXPECT_EQ(s.cancelled.size(), 10u);
    EXPECT_EQ(s.in_flight, 0u);
    EXPECT_TRUE(s.pending.empty());
    EXPECT_TRUE(s.conserved());
    EXPECT_EQ(s.retry_items().size(), 10u);
}

TEST_F(PoolTest, FollowupsOfDrainingRepliesAreCancelled) {
    Gate gate;
    auto finalize = [](const NumberItem& reply, Signals<NumberItem>&) {
        return Followups<NumberItem>::retry(reply.followup());
    };

    auto handle = NumberPool::start("drain", 2, numbers(2),
        [&](const NumberItem& item) {
            gate.enter();
            return item.job.n;
        },
        finalize);

    ASSERT_TRUE(test::wait_until([&] { return gate.entered() == 2; }));
    handle.kill();
    gate.open();
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(s.landed, 2u);
    EXPECT_EQ(s.cancelled.size(), 2u);
    EXPECT_EQ(s.enqueued, 4u);
    EXPECT_TRUE(s.conserved());
}

TEST_F(PoolTest, KillIsIdempotent) {
    auto handle = NumberPool::start("twice", 1, numbers(3), [](const NumberItem& i) { return i.job.n; }, {});
    handle.kill();
    handle.kill();
    handle.join();
    handle.join();
    EXPECT_TRUE(handle.killed());
    EXPECT_TRUE(handle.signals().conserved());
}

TEST_F(PoolTest, UnrecoverableStopsThePool) {
    auto finalize = [](const NumberItem& reply, Signals<NumberItem>&) {
        if (reply.job.n == 0) return Followups<NumberItem>::unrecoverable();
        return Followups<NumberItem>::none();
    };

    auto handle = NumberPool::start("fatal", 1, numbers(10), [](const NumberItem& i) { return i.job.n; }, finalize);
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(s.reason, ShutdownReason::Unrecoverable);
    ASSERT_EQ(s.failed.size(), 1u);
    EXPECT_EQ(s.failed[0].job.n, 0);
    EXPECT_EQ(s.landed, 1u);
    EXPECT_EQ(s.cancelled.size(), 9u);
    EXPECT_TRUE(handle.killed());
}

TEST_F(PoolTest, ThrowingFinalizeIsUnrecoverable) {
    auto finalize = [](const NumberItem&, Signals<NumberItem>&) -> Followups<NumberItem> {
        throw std::logic_error("finalize bug");
    };

    auto handle = NumberPool::start("bug", 1, numbers(3), [](const NumberItem& i) { return i.job.n; }, finalize);
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(s.reason, ShutdownReason::Unrecoverable);
    EXPECT_EQ(s.failed.size(), 1u);
}

TEST_F(PoolTest, DestructorKillsAndJoins) {
    Gate gate;
    std::atomic<int> ran{0};
    {
        auto handle = NumberPool::start("scoped", 2, numbers(100),
            [&](const NumberItem& item) {
                if (item.job.n < 2) gate.enter();
                ++ran;
                return item.job.n;
            },
            {});
        ASSERT_TRUE(test::wait_until([&] { return gate.entered() == 2; }));
        gate.open();
    }
    EXPECT_GE(ran.load(), 2);
    EXPECT_LE(ran.load(), 100);
}

TEST_F(PoolTest, RejectsBadArguments) {
    EXPECT_THROW(NumberPool::start("none", 0, numbers(1), [](const NumberItem&) { return 0; }, {}),
                 InvalidArgumentError);
    EXPECT_THROW(NumberPool::start("nowork", 1, numbers(1), {}, {}), InvalidArgumentError);
}

// =============================================================================
// End to end: copy ranges through a scripted executor
// =============================================================================

struct CopyRange {
    std::string table;
    int64_t lo = 0;
    int64_t hi = 0;
};

TEST_F(PoolTest, CopyJobsThroughExecutor) {
    using CopyPool = Pool<CopyRange, int64_t>;
    using CopyItem = CopyPool::Item;

    test::FakeExecutor db([](const std::string&, std::chrono::milliseconds) { return int64_t{10}; });

    std::vector<CopyItem> items;
    for (int i = 0; i < 4; ++i) {
        items.push_back(CopyItem::make(CopyRange{"target", i * 10, i * 10 + 10}, "copy" + std::to_string(i),
                                       3, 1000ms));
    }

    auto on_success = [](const CopyItem& reply, Signals<CopyItem>& s) {
        s.count("rows:" + reply.job.table, *reply.outcome.payload);
        return Followups<CopyItem>::none();
    };

    auto handle = CopyPool::start("copy", 2, items,
        [&db](const CopyItem& item) {
            return db.execute("INSERT " + std::to_string(item.job.lo), item.timeout);
        },
        range_splitting<CopyItem>(RetryPolicy{}, on_success));
    handle.join();

    auto s = handle.signals();
    EXPECT_EQ(s.landed, 4u);
    EXPECT_EQ(s.reason, ShutdownReason::Completed);
    EXPECT_TRUE(s.failed.empty());
    EXPECT_TRUE(s.cancelled.empty());
    EXPECT_TRUE(s.pending.empty());
    EXPECT_EQ(s.in_flight, 0u);
    EXPECT_EQ(s.counter("rows:target"), 40);
    EXPECT_EQ(db.executed().size(), 4u);
    // Quiescence closes the kill switch too
    EXPECT_TRUE(handle.killed());
}
