/**
 * @file sanitize.hpp
 * @brief Redaction helpers applied before job ids or failure text reach a log.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace jobtier {

inline constexpr std::size_t kMaxErrorMessageLength = 500;
inline constexpr std::string_view kRedactedPath = "[path]";

/**
 * @brief Redact absolute filesystem paths, drop control characters and
 *        truncate to @p max_length (ellipsis included).
 */
[[nodiscard]] std::string sanitize_error_message(std::string_view message,
                                                 std::size_t max_length = kMaxErrorMessageLength);

/**
 * @brief Keep only `[A-Za-z0-9_.-]` from a job id.
 */
[[nodiscard]] std::string sanitize_job_id(std::string_view id);

}  // namespace jobtier
