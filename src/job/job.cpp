/**
 * @file job.cpp
 * @brief Job identity and server-side validation.
 */

#include "job/job.hpp"

#include <atomic>
#include <cstdio>
#include <random>
#include <string>

namespace jobtier {

Job::Job(JobOptions options) : options_(std::move(options)) {
    if (options_.id.empty()) {
        options_.id = generate_job_id();
    }
}

Result<void> Job::load_fields(const nlohmann::json& fields) {
    if (!fields.is_object() || !fields.empty()) {
        return Error{ErrorCode::Validation,
                     std::string{type_name()} + " does not accept fields"};
    }
    return Result<void>{};
}

JobId generate_job_id() {
    static std::atomic<uint32_t> counter{0};
    thread_local std::mt19937_64 rng{std::random_device{}()};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%012llx%06x",
                  static_cast<unsigned long long>(rng() & 0xffffffffffffULL),
                  counter.fetch_add(1) & 0xffffffU);
    return JobId{buf};
}

Result<void> validate_job(const Job& job, const LimitsConfig& limits) {
    std::string errors;
    auto add = [&errors](const std::string& msg) {
        if (!errors.empty()) errors += "; ";
        errors += msg;
    };

    if (job.timeout_seconds() < 1 || job.timeout_seconds() > limits.max_timeout_s) {
        add("timeout_s=" + std::to_string(job.timeout_seconds())
            + " outside allowed range [1, " + std::to_string(limits.max_timeout_s) + "]");
    }
    if (job.max_memory_mb() < 1 || job.max_memory_mb() > limits.max_memory_mb) {
        add("max_memory_mb=" + std::to_string(job.max_memory_mb())
            + " outside allowed range [1, " + std::to_string(limits.max_memory_mb) + "]");
    }
    if (job.priority() < kMinPriority || job.priority() > kMaxPriority) {
        add("priority=" + std::to_string(job.priority()) + " outside allowed range ["
            + std::to_string(kMinPriority) + ", " + std::to_string(kMaxPriority) + "]");
    }

    if (!errors.empty()) {
        return Error{ErrorCode::Validation, "Job validation failed: " + errors};
    }
    return Result<void>{};
}

}  // namespace jobtier
