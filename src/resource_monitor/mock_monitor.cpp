/**
 * @file mock_monitor.cpp
 * @brief MockMonitor implementation — configurable health snapshots for testing.
 */

#include "resource_monitor/monitor.hpp"

namespace jobtier {

MockMonitor::MockMonitor(uint32_t /*sampling_interval_ms*/) {
    // A quiet 4-core host with 8 GB, half of it free
    static_snapshot_.load_average_1m = 0.4;
    static_snapshot_.cpu_cores = 4;
    static_snapshot_.memory_total_bytes = 8ULL * 1024 * 1024 * 1024;
    static_snapshot_.memory_available_bytes = 4ULL * 1024 * 1024 * 1024;
    process_rss_bytes_ = 32ULL * 1024 * 1024;
}

Result<HealthSnapshot> MockMonitor::read() {
    ++reads_;
    if (unavailable_) {
        return Error{ErrorCode::Io, "Health sample unavailable"};
    }
    HealthSnapshot snap = static_snapshot_;
    if (!sequence_.empty()) {
        snap = sequence_.front();
        sequence_.pop_front();
    }
    snap.timestamp = std::chrono::system_clock::now();
    snap.process_rss_bytes = process_rss_bytes_;
    return snap;
}

uint64_t MockMonitor::process_memory_bytes() {
    return process_rss_bytes_;
}

void MockMonitor::start() { started_ = true; }
void MockMonitor::stop()  { started_ = false; }

void MockMonitor::push_snapshot(HealthSnapshot snapshot) {
    sequence_.push_back(snapshot);
}

void MockMonitor::set_static_snapshot(HealthSnapshot snapshot) {
    static_snapshot_ = snapshot;
}

void MockMonitor::set_load(double load_average_1m, uint32_t cores) {
    static_snapshot_.load_average_1m = load_average_1m;
    static_snapshot_.cpu_cores = cores;
}

void MockMonitor::set_memory(uint64_t available, uint64_t total) {
    static_snapshot_.memory_available_bytes = available;
    static_snapshot_.memory_total_bytes = total;
}

void MockMonitor::set_process_memory(uint64_t rss_bytes) {
    process_rss_bytes_ = rss_bytes;
}

void MockMonitor::set_unavailable(bool unavailable) {
    unavailable_ = unavailable;
}

}  // namespace jobtier
