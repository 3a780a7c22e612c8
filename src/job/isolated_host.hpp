/**
 * @file isolated_host.hpp
 * @brief Child-process side of isolated execution.
 *
 * A host executable (the daemon itself, or a test helper) calls
 * run_isolated_host() when started with `--run-job-bundle <path>`. It rebuilds
 * the job through its registry, installs the memory ceiling and runs the body.
 * The exit code is the only success signal the parent trusts.
 */

#pragma once

#include "job/job_registry.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace jobtier {

inline constexpr std::string_view kRunBundleFlag = "--run-job-bundle";

enum class HostExit : int {
    Success = 0,
    JobFailed = 1,        ///< Body returned an error or threw
    BadBundle = 2,        ///< Unreadable or malformed bundle
    UnknownType = 3,      ///< Type not in this host's registry
    FieldsRejected = 4    ///< load_fields() refused the payload
};

/// Path following `--run-job-bundle`, if present.
[[nodiscard]] std::optional<std::filesystem::path> find_bundle_argument(int argc, char** argv);

/// Run the bundled job; returns the process exit code.
[[nodiscard]] int run_isolated_host(const JobRegistry& registry,
                                    const std::filesystem::path& bundle_path);

}  // namespace jobtier
