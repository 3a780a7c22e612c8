/**
 * @file memory_ceiling.hpp
 * @brief Address-space ceilings (RLIMIT_AS) relative to current usage.
 *
 * The ceiling is expressed as headroom on top of what the process has already
 * mapped, so a job asking for 64 MB gets 64 MB more than the runtime itself
 * occupies at the moment the job starts.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <sys/resource.h>

namespace jobtier {

inline constexpr uint64_t kBytesPerMb = 1024ULL * 1024ULL;

/// Current VmSize of this process in bytes (0 if unreadable).
[[nodiscard]] uint64_t current_virtual_memory_bytes();

/// Current VmRSS of this process in bytes (0 if unreadable).
[[nodiscard]] uint64_t current_resident_memory_bytes();

/**
 * @brief Permanently lower the soft RLIMIT_AS to VmSize + @p headroom_bytes.
 *
 * Used by the isolated host before running a job body.
 */
Result<void> apply_memory_ceiling(uint64_t headroom_bytes);

/**
 * @brief RAII soft RLIMIT_AS for the duration of an inline job body.
 *
 * The previous limit is restored by the destructor on every exit path. If
 * the limit cannot be installed the guard is inactive and the job simply
 * runs without it.
 */
class ScopedMemoryCeiling {
public:
    explicit ScopedMemoryCeiling(uint64_t headroom_bytes);
    ~ScopedMemoryCeiling();

    ScopedMemoryCeiling(const ScopedMemoryCeiling&) = delete;
    ScopedMemoryCeiling& operator=(const ScopedMemoryCeiling&) = delete;

    [[nodiscard]] bool active() const noexcept { return active_; }
    [[nodiscard]] uint64_t limit_bytes() const noexcept { return limit_bytes_; }

private:
    rlimit previous_{};
    uint64_t limit_bytes_{0};
    bool active_{false};
};

}  // namespace jobtier
