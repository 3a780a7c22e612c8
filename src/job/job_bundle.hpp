/**
 * @file job_bundle.hpp
 * @brief JSON bundle carrying a job's identity, limits and plain-data fields
 *        to an isolated child process.
 *
 * Wire format (one JSON object):
 *   {"format":"jobtier.bundle","version":1,"type":"...","id":"...",
 *    "timeout_s":N,"max_memory_mb":N,"priority":N,"fields":{...}}
 *
 * Decoding is strict: every key must be present with the right type and
 * unknown keys are rejected.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "job/job.hpp"
#include "job/job_registry.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace jobtier {

inline constexpr std::string_view kBundleFormat = "jobtier.bundle";
inline constexpr int kBundleVersion = 1;

struct JobBundle {
    std::string type;
    JobId id;
    uint32_t timeout_s = 0;
    uint32_t max_memory_mb = 0;
    int32_t priority = 0;
    nlohmann::json fields = nlohmann::json::object();
};

/// Snapshot a job; fails if its fields are not plain data.
Result<JobBundle> make_bundle(const Job& job);

/// Fails with Validation when a string in the bundle is not valid UTF-8.
Result<std::string> encode_bundle(const JobBundle& bundle);

Result<JobBundle> decode_bundle(std::string_view text);

/// Build a fresh instance of the bundle's type and assign its fields.
Result<std::unique_ptr<Job>> reconstruct_job(const JobBundle& bundle, const JobRegistry& registry);

/// Fields must be an object tree of scalars, arrays, objects and null.
Result<void> check_plain_data(const nlohmann::json& value);

}  // namespace jobtier
