/**
 * @file linux_monitor.cpp
 * @brief LinuxMonitor — load average, memory and process RSS from /proc.
 *
 * Sampling is performed by a dedicated std::jthread at a configurable
 * interval. The latest snapshot is published atomically for lock-free
 * reads by the Runtime's health timer.
 */

#include "resource_monitor/monitor.hpp"

#include "resource_monitor/memory_ceiling.hpp"
#include "resource_monitor/proc_reader.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <new>

namespace jobtier {

LinuxMonitor::LinuxMonitor(uint32_t sampling_interval_ms, Sampler sampler)
    : interval_ms_(sampling_interval_ms == 0 ? 1000 : sampling_interval_ms)
    , sampler_(sampler ? std::move(sampler) : Sampler{&LinuxMonitor::sample_once}) {}

LinuxMonitor::~LinuxMonitor() {
    stop();
}

void LinuxMonitor::start() {
    if (sampling_thread_.joinable()) return;
    publish_sample();
    sampling_thread_ = std::jthread([this](std::stop_token stop) {
        sampling_loop(stop);
    });
}

void LinuxMonitor::stop() {
    if (sampling_thread_.joinable()) {
        sampling_thread_.request_stop();
        sampling_thread_.join();
    }
}

Result<HealthSnapshot> LinuxMonitor::read() {
    auto snapshot = latest_.load();
    if (!snapshot) {
        return sampler_();
    }
    return *snapshot;
}

uint64_t LinuxMonitor::process_memory_bytes() {
    return current_resident_memory_bytes();
}

void LinuxMonitor::sampling_loop(std::stop_token stop) {
    std::mutex mutex;
    std::condition_variable_any cv;
    while (!stop.stop_requested()) {
        publish_sample();
        std::unique_lock lock(mutex);
        // Wakes early when stop is requested
        cv.wait_for(lock, stop, std::chrono::milliseconds(interval_ms_), [] { return false; });
    }
}

bool LinuxMonitor::publish_sample() {
    try {
        latest_.store(std::make_shared<HealthSnapshot>(sampler_()));
        return true;
    } catch (const std::bad_alloc&) {
        // An inline job's address-space ceiling covers this thread too; keep the last snapshot
        skipped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
}

HealthSnapshot LinuxMonitor::sample_once() {
    HealthSnapshot snap;
    snap.timestamp = std::chrono::system_clock::now();

    snap.load_average_1m = proc::read_load_average_1m().value_or(0.0);
    snap.cpu_cores = proc::cpu_core_count();

    auto mem = proc::parse_meminfo();
    snap.memory_total_bytes = mem.total_kb * 1024;
    snap.memory_available_bytes = mem.available_kb * 1024;

    snap.process_rss_bytes = current_resident_memory_bytes();
    return snap;
}

}  // namespace jobtier
