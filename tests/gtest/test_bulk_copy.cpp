// =============================================================================
// Bulk Copy and Partition Discovery Tests
// =============================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fake_executor.hpp"
#include "stevedore/error.hpp"
#include "stevedore/migrate/bulk_copy.hpp"

using namespace stevedore;
using namespace stevedore::migrate;
using namespace std::chrono_literals;

class BulkCopyTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_level(LogLevel::WARN);

        schema.parent = "events";
        schema.source_prefix = "events_old_";
        schema.partition_key = "id";
        schema.copy_key = "id";
        schema.columns = {"id BIGINT", "created_at TIMESTAMPTZ"};

        policy.retries = 2;
        policy.timeout = 50ms;
        policy.timeout_step = 50ms;
    }

    db::PartitionSchema schema;
    pool::RetryPolicy policy;
};

// =============================================================================
// Batch planning
// =============================================================================

TEST_F(BulkCopyTest, BatchesCoverRangeExactly) {
    auto batches = plan_batches(0, 10, 4);
    std::vector<Batch> expected{{0, 4}, {4, 8}, {8, 10}};
    EXPECT_EQ(batches, expected);
}

TEST_F(BulkCopyTest, BatchLargerThanRange) {
    auto batches = plan_batches(5, 8, 100);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0], (Batch{5, 8}));
}

TEST_F(BulkCopyTest, EmptyRangeHasNoBatches) {
    EXPECT_TRUE(plan_batches(7, 7, 3).empty());
    EXPECT_TRUE(plan_batches(9, 7, 3).empty());
}

TEST_F(BulkCopyTest, BatchesNearInt64Max) {
    int64_t hi = std::numeric_limits<int64_t>::max();
    auto batches = plan_batches(hi - 5, hi, 4);
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0], (Batch{hi - 5, hi - 1}));
    EXPECT_EQ(batches[1], (Batch{hi - 1, hi}));
}

TEST_F(BulkCopyTest, RejectsNonPositiveBatch) {
    EXPECT_THROW(plan_batches(0, 10, 0), InvalidArgumentError);
}

TEST_F(BulkCopyTest, PlanCopyPerPartition) {
    std::vector<Partition> parts{Partition::make(1, 0, 10), Partition{2, 10, 20, 10, 15}};
    auto items = plan_copy(schema, parts, 5, policy);

    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].job.from, "events_old_1");
    EXPECT_EQ(items[0].job.to, "events_partition_1");
    EXPECT_EQ(items[0].job.lo, 0);
    EXPECT_EQ(items[0].job.hi, 5);
    EXPECT_EQ(items[1].job.lo, 5);
    EXPECT_EQ(items[2].job.from, "events_old_2");
    EXPECT_EQ(items[2].job.lo, 10);
    EXPECT_EQ(items[2].job.hi, 15);
    EXPECT_EQ(items[2].label, "events_old_2->events_partition_2");
    EXPECT_EQ(items[2].retries, policy.retries);
    EXPECT_EQ(items[2].timeout, policy.timeout);
}

// =============================================================================
// Bulk copy pool
// =============================================================================

TEST_F(BulkCopyTest, CopiesAndCountsRows) {
    test::FakeExecutor db([](const std::string&, std::chrono::milliseconds) { return int64_t{5}; });
    auto items = plan_copy(schema, {Partition::make(1, 0, 20), Partition::make(2, 20, 30)}, 5, policy);

    auto handle = start_bulk_copy(db, 3, items, policy);
    handle.join();
    auto s = handle.signals();

    EXPECT_EQ(s.reason, pool::ShutdownReason::Completed);
    EXPECT_EQ(s.landed, 6u);
    EXPECT_EQ(s.counter("rows:events_partition_1"), 20);
    EXPECT_EQ(s.counter("rows:events_partition_2"), 10);
    EXPECT_EQ(db.count_containing("INSERT INTO events_partition_1 SELECT * FROM events_old_1 WHERE id BETWEEN 15 AND 19"), 1u);
}

TEST_F(BulkCopyTest, TimedOutRangeIsSplit) {
    test::FakeExecutor db([](const std::string& sql, std::chrono::milliseconds) -> int64_t {
        if (sql.find("BETWEEN 0 AND 99") != std::string::npos) {
            throw StatementTimeout("canceling statement due to statement timeout");
        }
        return 1;
    });
    auto items = plan_copy(schema, {Partition::make(1, 0, 100)}, 100, policy);

    auto handle = start_bulk_copy(db, 2, items, policy);
    handle.join();
    auto s = handle.signals();

    EXPECT_EQ(db.count_containing("BETWEEN 0 AND 49"), 1u);
    EXPECT_EQ(db.count_containing("BETWEEN 50 AND 99"), 1u);
    EXPECT_EQ(s.landed, 3u);
    EXPECT_EQ(s.enqueued, 3u);
    EXPECT_EQ(s.counter("rows:events_partition_1"), 2);
    EXPECT_TRUE(s.failed.empty());
}

TEST_F(BulkCopyTest, SingleKeyTimeoutEscalates) {
    policy.max_escalations = 2;
    test::FakeExecutor db([](const std::string&, std::chrono::milliseconds) -> int64_t {
        throw StatementTimeout("canceling statement due to statement timeout");
    });
    auto items = plan_copy(schema, {Partition::make(1, 41, 42)}, 100, policy);

    auto handle = start_bulk_copy(db, 1, items, policy);
    handle.join();
    auto s = handle.signals();

    auto executed = db.executed();
    ASSERT_EQ(executed.size(), 3u);
    EXPECT_EQ(executed[0].timeout, 50ms);
    EXPECT_EQ(executed[1].timeout, 100ms);
    EXPECT_EQ(executed[2].timeout, 150ms);
    ASSERT_EQ(s.failed.size(), 1u);
    EXPECT_EQ(s.failed[0].job.lo, 41);
    EXPECT_EQ(s.failed[0].job.hi, 42);
}

// =============================================================================
// Discovery
// =============================================================================

TEST_F(BulkCopyTest, DiscoversPartitionBounds) {
    test::FakeExecutor db;
    db.set_range("events_old_1", "id", 0, 999);
    db.set_range("events_old_2", "id", 1000, 1999);
    // events_old_3 has no rows

    auto found = std::make_shared<DiscoveredPartitions>();
    auto handle = start_discovery(db, schema, 1, 4, 2, policy, found);
    handle.join();
    auto s = handle.signals();

    std::vector<Partition> expected{Partition::make(1, 0, 1000), Partition::make(2, 1000, 2000)};
    EXPECT_EQ(found->partitions(), expected);
    EXPECT_EQ(found->empty(), std::vector<int64_t>{3});
    EXPECT_EQ(s.counter("discovered"), 2);
    EXPECT_EQ(s.counter("empty"), 1);
    EXPECT_EQ(s.reason, pool::ShutdownReason::Completed);
}

TEST_F(BulkCopyTest, DiscoversSeparateCopyBounds) {
    schema.copy_key = "seq";
    test::FakeExecutor db;
    db.set_range("events_old_5", "id", 100, 199);
    db.set_range("events_old_5", "seq", 7000, 7099);

    auto found = std::make_shared<DiscoveredPartitions>();
    auto handle = start_discovery(db, schema, 5, 6, 1, policy, found);
    handle.join();

    auto parts = found->partitions();
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], (Partition{5, 100, 200, 7000, 7100}));
}

TEST_F(BulkCopyTest, DiscoveryFailureIsRecorded) {
    auto broken = std::make_shared<DiscoveredPartitions>();

    class Failing : public test::FakeExecutor {
    public:
        std::optional<db::KeyRange> key_range(const std::string& table, const std::string&,
                                              std::chrono::milliseconds) override {
            throw DatabaseError("relation \"" + table + "\" does not exist", "42P01");
        }
    } failing;

    auto handle = start_discovery(failing, schema, 1, 2, 1, policy, broken);
    handle.join();
    auto s = handle.signals();

    EXPECT_TRUE(broken->partitions().empty());
    ASSERT_EQ(s.failed.size(), 1u);
    EXPECT_EQ(s.landed, 3u);  // first attempt plus two retries
}

TEST_F(BulkCopyTest, DiscoveryRejectsReversedRange) {
    test::FakeExecutor db;
    EXPECT_THROW(start_discovery(db, schema, 5, 1, 1, policy, std::make_shared<DiscoveredPartitions>()),
                 InvalidArgumentError);
}
