/**
 * @file proc_reader.hpp
 * @brief Parsers for the Linux pseudo-files the monitor and the memory
 *        ceiling read.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobtier::proc {

std::vector<std::string> read_file_lines(const std::string& path);

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
};

/// /proc/meminfo → MemTotal / MemAvailable.
MemInfo parse_meminfo();

/// First field of /proc/loadavg.
std::optional<double> read_load_average_1m();

/// Value in kB of a `Name:   1234 kB` line in /proc/self/status.
std::optional<uint64_t> read_self_status_kb(std::string_view field);

/// Online processors (never 0).
uint32_t cpu_core_count();

}  // namespace jobtier::proc
