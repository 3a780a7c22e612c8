/**
 * @file monitor.hpp
 * @brief Health monitor implementations.
 *
 * Provides LinuxMonitor (reads from /proc) and MockMonitor (testing).
 * Both satisfy the ResourceMonitorLike concept so the Runtime can be
 * instantiated over either without virtual dispatch.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <thread>

namespace jobtier {

// ─────────────────────────────────────────────
// LinuxMonitor
// ─────────────────────────────────────────────

/**
 * @brief Reads host and process health from Linux pseudo-filesystems.
 *
 * Runs a dedicated sampling thread (std::jthread) and stores the latest
 * snapshot atomically; the loop-side timers only ever read it.
 *
 * Data sources:
 *   /proc/loadavg       — 1-minute load average
 *   /proc/meminfo       — Memory total and available
 *   /proc/self/status   — Resident set of this process
 *   sysconf             — Online core count
 */
class LinuxMonitor {
public:
    using Sampler = std::function<HealthSnapshot()>;

    /// An empty sampler means sample_once().
    explicit LinuxMonitor(uint32_t sampling_interval_ms = 1000, Sampler sampler = {});
    ~LinuxMonitor();

    // Non-copyable
    LinuxMonitor(const LinuxMonitor&) = delete;
    LinuxMonitor& operator=(const LinuxMonitor&) = delete;

    // ResourceMonitorLike interface
    Result<HealthSnapshot> read();
    uint64_t process_memory_bytes();
    void start();
    void stop();

    /// Take a fresh sample on the calling thread.
    [[nodiscard]] static HealthSnapshot sample_once();

    /// Samples dropped because memory could not be allocated.
    [[nodiscard]] uint64_t skipped_samples() const noexcept {
        return skipped_.load(std::memory_order_relaxed);
    }

private:
    void sampling_loop(std::stop_token stop);
    bool publish_sample();

    uint32_t interval_ms_;
    Sampler sampler_;
    std::atomic<uint64_t> skipped_{0};
    std::jthread sampling_thread_;
    std::atomic<std::shared_ptr<HealthSnapshot>> latest_;
};

// ─────────────────────────────────────────────
// MockMonitor
// ─────────────────────────────────────────────

/**
 * @brief Scripted health source for tests.
 *
 * Returns queued snapshots in order, then falls back to the static snapshot.
 */
class MockMonitor {
public:
    /// The interval is accepted for parity with LinuxMonitor and ignored.
    explicit MockMonitor(uint32_t sampling_interval_ms = 0);

    // ResourceMonitorLike interface
    Result<HealthSnapshot> read();
    uint64_t process_memory_bytes();
    void start();
    void stop();

    // Test helpers — configure what snapshots are returned
    void push_snapshot(HealthSnapshot snapshot);
    void set_static_snapshot(HealthSnapshot snapshot);
    void set_load(double load_average_1m, uint32_t cores = 4);
    void set_memory(uint64_t available, uint64_t total);
    void set_process_memory(uint64_t rss_bytes);
    void set_unavailable(bool unavailable);

    [[nodiscard]] bool started() const noexcept { return started_; }
    [[nodiscard]] size_t read_count() const noexcept { return reads_; }

private:
    std::deque<HealthSnapshot> sequence_;
    HealthSnapshot static_snapshot_;
    uint64_t process_rss_bytes_{0};
    bool unavailable_{false};
    bool started_{false};
    size_t reads_{0};
};

// Verify concept satisfaction at compile time
static_assert(ResourceMonitorLike<LinuxMonitor>);
static_assert(ResourceMonitorLike<MockMonitor>);

}  // namespace jobtier
