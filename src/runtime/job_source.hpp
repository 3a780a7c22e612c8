/**
 * @file job_source.hpp
 * @brief Where a Worker pulls jobs from.
 *
 * The Runtime never knows how a job was stored or transported; a source
 * only yields ready-made Job instances and takes back the ones that could
 * not be admitted.
 */

#pragma once

#include "job/job.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace jobtier {

// ─────────────────────────────────────────────
// IJobSource (Virtual — chosen by the host)
// ─────────────────────────────────────────────

class IJobSource {
public:
    virtual ~IJobSource() = default;

    /// Next job to run, or nullptr when nothing is pending.
    virtual std::unique_ptr<Job> next() = 0;

    /// Return a job that was taken but not admitted. It is handed out again
    /// before later jobs of the same priority.
    virtual void release(std::unique_ptr<Job> job) = 0;

    [[nodiscard]] virtual size_t pending() const = 0;
};

/**
 * @brief In-memory queue: higher priority first, FIFO within a priority.
 *
 * Thread-safe, so producers may push from any thread while the Worker
 * drains it on the loop thread.
 */
class QueueJobSource : public IJobSource {
public:
    void push(std::unique_ptr<Job> job);

    std::unique_ptr<Job> next() override;
    void release(std::unique_ptr<Job> job) override;
    [[nodiscard]] size_t pending() const override;

private:
    mutable std::mutex mutex_;
    std::multimap<int32_t, std::unique_ptr<Job>, std::greater<>> jobs_;
};

}  // namespace jobtier
