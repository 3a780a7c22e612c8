/**
 * @file test_monitor.cpp
 * @brief Unit tests for MockMonitor, LinuxMonitor and the memory ceiling.
 */

#include "resource_monitor/memory_ceiling.hpp"
#include "resource_monitor/monitor.hpp"
#include "resource_monitor/proc_reader.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <new>
#include <thread>

using namespace jobtier;

// ─── MockMonitor ─────────────────────────────

TEST(MockMonitorTest, DefaultSnapshot) {
    MockMonitor monitor;
    monitor.start();
    EXPECT_TRUE(monitor.started());

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->load_average_1m, 0.4);
    EXPECT_EQ(result->cpu_cores, 4u);
    EXPECT_EQ(result->memory_total_bytes, 8ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(result->memory_available_bytes, 4ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(result->process_rss_bytes, 32ULL * 1024 * 1024);
}

TEST(MockMonitorTest, SetLoad) {
    MockMonitor monitor;
    monitor.set_load(6.0, 8);

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->normalized_load(), 0.75);
}

TEST(MockMonitorTest, SetMemory) {
    MockMonitor monitor;
    uint64_t avail = 1ULL * 1024 * 1024 * 1024;  // 1 GB
    uint64_t total = 8ULL * 1024 * 1024 * 1024;  // 8 GB
    monitor.set_memory(avail, total);

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->memory_available_bytes, avail);
    EXPECT_EQ(result->memory_total_bytes, total);
    EXPECT_DOUBLE_EQ(result->memory_fraction(), 0.875);
}

TEST(MockMonitorTest, ProcessMemory) {
    MockMonitor monitor;
    monitor.set_process_memory(600ULL * 1024 * 1024);
    EXPECT_EQ(monitor.process_memory_bytes(), 600ULL * 1024 * 1024);
}

TEST(MockMonitorTest, SequenceMode) {
    MockMonitor monitor;

    HealthSnapshot snap1;
    snap1.load_average_1m = 1.0;
    snap1.cpu_cores = 2;

    HealthSnapshot snap2;
    snap2.load_average_1m = 3.0;
    snap2.cpu_cores = 2;

    monitor.push_snapshot(snap1);
    monitor.push_snapshot(snap2);

    auto r1 = monitor.read();
    ASSERT_TRUE(r1.has_value());
    EXPECT_DOUBLE_EQ(r1->normalized_load(), 0.5);

    auto r2 = monitor.read();
    ASSERT_TRUE(r2.has_value());
    EXPECT_DOUBLE_EQ(r2->normalized_load(), 1.5);

    // Sequence exhausted: back to the static snapshot
    auto r3 = monitor.read();
    ASSERT_TRUE(r3.has_value());
    EXPECT_DOUBLE_EQ(r3->load_average_1m, 0.4);
    EXPECT_EQ(monitor.read_count(), 3u);
}

TEST(MockMonitorTest, Unavailable) {
    MockMonitor monitor;
    monitor.set_unavailable(true);
    auto result = monitor.read();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::Io));
}

TEST(MockMonitorTest, TimestampIsRecent) {
    MockMonitor monitor;
    auto before = std::chrono::system_clock::now();
    auto result = monitor.read();
    auto after = std::chrono::system_clock::now();

    ASSERT_TRUE(result.has_value());
    EXPECT_GE(result->timestamp, before);
    EXPECT_LE(result->timestamp, after);
}

// ─── LinuxMonitor (can test on any Linux host) ───

TEST(LinuxMonitorTest, ReadBeforeStartSamplesDirectly) {
    LinuxMonitor monitor(500);
    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_GT(result->memory_total_bytes, 0u);
}

TEST(LinuxMonitorTest, StartAndRead) {
    LinuxMonitor monitor(100);
    monitor.start();

    // Give the sampling thread time to produce a snapshot
    std::this_thread::sleep_for(std::chrono::milliseconds(250));

    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());

    // On any Linux host these should be non-zero
    EXPECT_GT(result->memory_total_bytes, 0u);
    EXPECT_GT(result->memory_available_bytes, 0u);
    EXPECT_GE(result->cpu_cores, 1u);
    EXPECT_GT(result->process_rss_bytes, 0u);

    monitor.stop();
}

TEST(LinuxMonitorTest, MemoryComputations) {
    auto snap = LinuxMonitor::sample_once();
    EXPECT_LE(snap.memory_available_bytes, snap.memory_total_bytes);
    EXPECT_GE(snap.memory_fraction(), 0.0);
    EXPECT_LE(snap.memory_fraction(), 1.0);
    EXPECT_GE(snap.load_average_1m, 0.0);
}

TEST(LinuxMonitorTest, StopIsIdempotent) {
    LinuxMonitor monitor(50);
    monitor.start();
    monitor.stop();
    monitor.stop();
    EXPECT_GT(monitor.process_memory_bytes(), 0u);
}

TEST(LinuxMonitorTest, SamplingSurvivesAllocationFailure) {
    std::atomic<int> calls{0};
    LinuxMonitor monitor(1, [&calls] {
        int n = ++calls;
        if (n >= 2 && n <= 4) throw std::bad_alloc();
        HealthSnapshot snap;
        snap.cpu_cores = 4;
        snap.load_average_1m = static_cast<double>(n);
        return snap;
    });
    monitor.start();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (calls.load() < 6 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    monitor.stop();

    EXPECT_GE(calls.load(), 6);
    EXPECT_EQ(monitor.skipped_samples(), 3u);
    auto result = monitor.read();
    ASSERT_TRUE(result.has_value());
    EXPECT_GE(result->load_average_1m, 5.0);
}

// ─── /proc readers and memory ceiling ────────

TEST(ProcReaderTest, SelfStatus) {
    auto rss = proc::read_self_status_kb("VmRSS");
    ASSERT_TRUE(rss.has_value());
    EXPECT_GT(*rss, 0u);
    EXPECT_FALSE(proc::read_self_status_kb("NoSuchField").has_value());
}

TEST(ProcReaderTest, CoreCountNeverZero) {
    EXPECT_GE(proc::cpu_core_count(), 1u);
}

TEST(MemoryCeilingTest, ScopedCeilingRestoresLimit) {
    rlimit before{};
    ASSERT_EQ(::getrlimit(RLIMIT_AS, &before), 0);
    {
        ScopedMemoryCeiling ceiling(256 * kBytesPerMb);
        if (ceiling.active()) {
            rlimit during{};
            ASSERT_EQ(::getrlimit(RLIMIT_AS, &during), 0);
            EXPECT_EQ(during.rlim_cur, ceiling.limit_bytes());
        }
    }
    rlimit after{};
    ASSERT_EQ(::getrlimit(RLIMIT_AS, &after), 0);
    EXPECT_EQ(after.rlim_cur, before.rlim_cur);
}
