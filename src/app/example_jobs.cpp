/**
 * @file example_jobs.cpp
 * @brief Registration of the bundled example job types.
 */

#include "app/example_jobs.hpp"

namespace jobtier {

Result<void> register_example_jobs(JobRegistry& registry) {
    if (auto r = register_send_email_job(registry); !r) return r;
    if (auto r = register_generate_report_job(registry); !r) return r;
    return register_process_video_job(registry);
}

}  // namespace jobtier
