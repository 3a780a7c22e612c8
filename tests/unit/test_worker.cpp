/**
 * @file test_worker.cpp
 * @brief Unit tests for QueueJobSource and the Worker polling loop.
 */

#include "runtime/job_source.hpp"
#include "runtime/runtime.hpp"
#include "runtime/worker.hpp"
#include "support/test_jobs.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace jobtier;
using namespace jobtier::test;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<Job> quick_job(std::string id, int32_t priority = 0) {
    return std::make_unique<SucceedJob>(
        JobOptions{.id = std::move(id), .isolated = false, .priority = priority});
}

}  // anonymous namespace

// ─── QueueJobSource ──────────────────────────

TEST(QueueJobSourceTest, PriorityThenFifo) {
    QueueJobSource source;
    source.push(quick_job("a", 0));
    source.push(quick_job("b", 5));
    source.push(quick_job("c", 0));
    source.push(quick_job("d", -1));
    source.push(nullptr);
    EXPECT_EQ(source.pending(), 4u);

    std::vector<std::string> order;
    while (auto job = source.next()) order.push_back(job->id());
    EXPECT_EQ(order, (std::vector<std::string>{"b", "a", "c", "d"}));
    EXPECT_EQ(source.next(), nullptr);
}

TEST(QueueJobSourceTest, ReleasedJobComesBackFirst) {
    QueueJobSource source;
    source.push(quick_job("a"));
    source.push(quick_job("b"));

    auto a = source.next();
    ASSERT_NE(a, nullptr);
    source.release(std::move(a));
    EXPECT_EQ(source.pending(), 2u);
    EXPECT_EQ(source.next()->id(), "a");
    EXPECT_EQ(source.next()->id(), "b");
}

// ─── Worker ──────────────────────────────────

class WorkerTest : public ::testing::Test {
protected:
    using TestRuntime = Runtime<MockMonitor>;

    Config config_ = default_config();
    WorkerConfig worker_config_;
    std::shared_ptr<MemorySink::Buffer> events_ = std::make_shared<MemorySink::Buffer>();
    std::unique_ptr<TestRuntime> runtime_;
    QueueJobSource source_;

    void create() {
        TestRuntime::Options opts;
        opts.config = config_;
        opts.log_sink = std::make_unique<NullSink>();
        opts.event_sink = std::make_unique<MemorySink>(events_);
        runtime_ = std::make_unique<TestRuntime>(std::move(opts));
    }

    std::string shutdown_reason() {
        std::lock_guard lock(events_->mutex);
        for (const auto& line : events_->lines) {
            auto json = nlohmann::json::parse(line);
            if (json["event"] == "shutdown_initiated") {
                return json["data"]["reason"].get<std::string>();
            }
        }
        return {};
    }
};

TEST_F(WorkerTest, DrainsSourceInOnePass) {
    create();
    for (int i = 0; i < 3; ++i) source_.push(quick_job("job-" + std::to_string(i)));

    Worker<TestRuntime> worker(*runtime_, source_, worker_config_, runtime_->logger());
    worker.poll_once();

    EXPECT_EQ(worker.dispatched(), 3u);
    EXPECT_EQ(source_.pending(), 0u);
    EXPECT_EQ(runtime_->stats().processed, 3u);
    EXPECT_TRUE(runtime_->is_accepting());
}

TEST_F(WorkerTest, JobBudgetShutsRuntimeDown) {
    worker_config_.max_jobs = 2;
    create();
    for (int i = 0; i < 3; ++i) source_.push(quick_job("job-" + std::to_string(i)));

    Worker<TestRuntime> worker(*runtime_, source_, worker_config_, runtime_->logger());
    worker.poll_once();

    EXPECT_EQ(worker.dispatched(), 2u);
    EXPECT_EQ(source_.pending(), 1u);
    EXPECT_TRUE(runtime_->is_stopped());
    EXPECT_EQ(shutdown_reason(), "max_jobs reached");
}

TEST_F(WorkerTest, AdmissionRefusalReleasesAndBacksOff) {
    config_.limits.max_jobs_per_minute = 1;
    worker_config_.backoff_ms = 60000;
    create();
    source_.push(quick_job("first"));
    source_.push(quick_job("second"));

    Worker<TestRuntime> worker(*runtime_, source_, worker_config_, runtime_->logger());
    worker.poll_once();
    EXPECT_EQ(worker.dispatched(), 1u);
    EXPECT_EQ(worker.rejected(), 1u);
    ASSERT_EQ(source_.pending(), 1u);

    // Still backing off: the queue is not touched
    worker.poll_once();
    EXPECT_EQ(worker.rejected(), 1u);
    EXPECT_EQ(source_.next()->id(), "second");
}

TEST_F(WorkerTest, InvalidJobsDropped) {
    create();
    source_.push(std::make_unique<SucceedJob>(
        JobOptions{.id = "too-long", .timeout_s = 400, .isolated = false}));
    source_.push(quick_job("fine"));

    Worker<TestRuntime> worker(*runtime_, source_, worker_config_, runtime_->logger());
    worker.poll_once();
    EXPECT_EQ(worker.dropped(), 1u);
    EXPECT_EQ(worker.dispatched(), 1u);
    EXPECT_EQ(source_.pending(), 0u);
}

TEST_F(WorkerTest, StopsWhenRuntimeShutsDown) {
    create();
    Worker<TestRuntime> worker(*runtime_, source_, worker_config_, runtime_->logger());
    worker.start();
    EXPECT_TRUE(worker.is_polling());

    runtime_->shutdown("test");
    source_.push(quick_job("late"));
    worker.poll_once();

    EXPECT_FALSE(worker.is_polling());
    EXPECT_EQ(worker.dispatched(), 0u);
    EXPECT_EQ(source_.pending(), 1u);
}

TEST_F(WorkerTest, PollsOnLoopUntilBudgetSpent) {
    worker_config_.poll_interval_ms = 10;
    worker_config_.max_jobs = 3;
    create();
    for (int i = 0; i < 3; ++i) source_.push(quick_job("job-" + std::to_string(i)));

    Worker<TestRuntime> worker(*runtime_, source_, worker_config_, runtime_->logger());
    ASSERT_TRUE(runtime_->start().has_value());
    worker.start();

    EXPECT_TRUE(runtime_->loop().run_until([&] { return runtime_->is_stopped(); }, 2000ms));
    EXPECT_EQ(worker.dispatched(), 3u);
    EXPECT_FALSE(worker.is_polling());
}

TEST_F(WorkerTest, TimeLimitShutsRuntimeDown) {
    worker_config_.poll_interval_ms = 10;
    worker_config_.max_time_s = 1;
    create();

    Worker<TestRuntime> worker(*runtime_, source_, worker_config_, runtime_->logger());
    ASSERT_TRUE(runtime_->start().has_value());
    worker.start();

    EXPECT_TRUE(runtime_->loop().run_until([&] { return runtime_->is_stopped(); }, 3000ms));
    EXPECT_EQ(shutdown_reason(), "max_time reached");
    EXPECT_FALSE(worker.is_polling());
}
