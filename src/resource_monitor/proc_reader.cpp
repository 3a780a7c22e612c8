/**
 * @file proc_reader.cpp
 * @brief /proc parsing helpers shared by LinuxMonitor and ScopedMemoryCeiling.
 */

#include "resource_monitor/proc_reader.hpp"

#include <fstream>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace jobtier::proc {

std::vector<std::string> read_file_lines(const std::string& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

MemInfo parse_meminfo() {
    MemInfo info;
    auto lines = read_file_lines("/proc/meminfo");
    for (const auto& line : lines) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> info.total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> info.available_kb;
        }
    }
    return info;
}

std::optional<double> read_load_average_1m() {
    std::ifstream ifs("/proc/loadavg");
    double load = 0.0;
    if (!(ifs >> load)) return std::nullopt;
    return load;
}

std::optional<uint64_t> read_self_status_kb(std::string_view field) {
    auto lines = read_file_lines("/proc/self/status");
    for (const auto& line : lines) {
        if (line.size() > field.size() && line.starts_with(field) && line[field.size()] == ':') {
            std::istringstream iss(line.substr(field.size() + 1));
            uint64_t kb = 0;
            if (iss >> kb) return kb;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

uint32_t cpu_core_count() {
    long online = ::sysconf(_SC_NPROCESSORS_ONLN);
    if (online > 0) return static_cast<uint32_t>(online);
    auto hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

}  // namespace jobtier::proc
