/**
 * @file example_jobs.hpp
 * @brief Job types bundled with the daemon.
 *
 * Each type lives in its own translation unit under app/jobs/ and reports
 * that file as its source, so the analyzer classifies it from real code:
 *   SendEmailJob        → inline   (no blocking calls)
 *   GenerateReportJob   → pooled   (file output)
 *   ProcessVideoExport  → isolated (shells out to ffmpeg)
 */

#pragma once

#include "job/job_registry.hpp"

namespace jobtier {

Result<void> register_send_email_job(JobRegistry& registry);
Result<void> register_generate_report_job(JobRegistry& registry);
Result<void> register_process_video_job(JobRegistry& registry);

/// Register every bundled type. Fails on the first duplicate name.
Result<void> register_example_jobs(JobRegistry& registry);

}  // namespace jobtier
