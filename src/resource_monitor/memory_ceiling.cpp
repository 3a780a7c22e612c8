/**
 * @file memory_ceiling.cpp
 * @brief setrlimit(RLIMIT_AS) wrappers.
 */

#include "resource_monitor/memory_ceiling.hpp"

#include "resource_monitor/proc_reader.hpp"

#include <cerrno>
#include <cstring>
#include <string>

namespace jobtier {

namespace {

/// Soft limit for VmSize + headroom, never above the hard limit.
rlim_t compute_limit(uint64_t headroom_bytes, const rlimit& current) {
    uint64_t target = current_virtual_memory_bytes() + headroom_bytes;
    if (current.rlim_max != RLIM_INFINITY && target > current.rlim_max) {
        return current.rlim_max;
    }
    return static_cast<rlim_t>(target);
}

}  // anonymous namespace

uint64_t current_virtual_memory_bytes() {
    return proc::read_self_status_kb("VmSize").value_or(0) * 1024;
}

uint64_t current_resident_memory_bytes() {
    return proc::read_self_status_kb("VmRSS").value_or(0) * 1024;
}

Result<void> apply_memory_ceiling(uint64_t headroom_bytes) {
    rlimit current{};
    if (::getrlimit(RLIMIT_AS, &current) != 0) {
        return Error{ErrorCode::Io, std::string{"getrlimit failed: "} + std::strerror(errno)};
    }
    rlimit next = current;
    next.rlim_cur = compute_limit(headroom_bytes, current);
    if (::setrlimit(RLIMIT_AS, &next) != 0) {
        return Error{ErrorCode::Io, std::string{"setrlimit failed: "} + std::strerror(errno)};
    }
    return Result<void>{};
}

ScopedMemoryCeiling::ScopedMemoryCeiling(uint64_t headroom_bytes) {
    if (::getrlimit(RLIMIT_AS, &previous_) != 0) return;

    rlimit next = previous_;
    next.rlim_cur = compute_limit(headroom_bytes, previous_);
    // Never loosen an existing tighter limit
    if (previous_.rlim_cur != RLIM_INFINITY && next.rlim_cur > previous_.rlim_cur) {
        next.rlim_cur = previous_.rlim_cur;
    }
    if (::setrlimit(RLIMIT_AS, &next) != 0) return;

    limit_bytes_ = static_cast<uint64_t>(next.rlim_cur);
    active_ = true;
}

ScopedMemoryCeiling::~ScopedMemoryCeiling() {
    if (active_) {
        ::setrlimit(RLIMIT_AS, &previous_);
    }
}

}  // namespace jobtier
