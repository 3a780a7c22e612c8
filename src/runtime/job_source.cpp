/**
 * @file job_source.cpp
 * @brief In-memory priority queue of pending jobs.
 */

#include "runtime/job_source.hpp"

namespace jobtier {

void QueueJobSource::push(std::unique_ptr<Job> job) {
    if (!job) return;
    std::lock_guard lock(mutex_);
    const int32_t priority = job->priority();
    // Equal keys keep insertion order, so this appends within the priority
    jobs_.emplace(priority, std::move(job));
}

std::unique_ptr<Job> QueueJobSource::next() {
    std::lock_guard lock(mutex_);
    if (jobs_.empty()) return nullptr;
    auto it = jobs_.begin();
    auto job = std::move(it->second);
    jobs_.erase(it);
    return job;
}

void QueueJobSource::release(std::unique_ptr<Job> job) {
    if (!job) return;
    std::lock_guard lock(mutex_);
    const int32_t priority = job->priority();
    jobs_.emplace_hint(jobs_.lower_bound(priority), priority, std::move(job));
}

size_t QueueJobSource::pending() const {
    std::lock_guard lock(mutex_);
    return jobs_.size();
}

}  // namespace jobtier
