/**
 * @file isolated_host.cpp
 * @brief Rebuild and run one bundled job; report failure on stderr.
 */

#include "job/isolated_host.hpp"

#include "job/job_bundle.hpp"
#include "resource_monitor/memory_ceiling.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <new>
#include <string>

namespace jobtier {

namespace {

constexpr std::streamsize kMaxBundleBytes = 16 * 1024 * 1024;

int exit_with(HostExit code, std::string_view message) {
    if (!message.empty()) {
        std::cerr << message << '\n';
    }
    return static_cast<int>(code);
}

}  // anonymous namespace

std::optional<std::filesystem::path> find_bundle_argument(int argc, char** argv) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view{argv[i]} == kRunBundleFlag) {
            return std::filesystem::path{argv[i + 1]};
        }
    }
    return std::nullopt;
}

int run_isolated_host(const JobRegistry& registry, const std::filesystem::path& bundle_path) {
    std::ifstream ifs(bundle_path, std::ios::binary);
    if (!ifs.is_open()) {
        return exit_with(HostExit::BadBundle, "Cannot open job bundle");
    }
    std::string text;
    text.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    if (static_cast<std::streamsize>(text.size()) > kMaxBundleBytes) {
        return exit_with(HostExit::BadBundle, "Job bundle too large");
    }

    auto bundle = decode_bundle(text);
    if (!bundle) {
        return exit_with(HostExit::BadBundle, bundle.error().message);
    }
    if (!registry.contains(bundle->type)) {
        return exit_with(HostExit::UnknownType, "Unknown job type '" + bundle->type + "'");
    }

    auto job = reconstruct_job(*bundle, registry);
    if (!job) {
        return exit_with(HostExit::FieldsRejected, job.error().message);
    }

    if (auto ceiling = apply_memory_ceiling(bundle->max_memory_mb * kBytesPerMb); !ceiling) {
        std::cerr << "Memory ceiling not applied: " << ceiling.error().message << '\n';
    }

    try {
        auto result = (*job)->execute();
        if (!result) {
            return exit_with(HostExit::JobFailed, "Job failed: " + result.error().message);
        }
    } catch (const std::bad_alloc&) {
        return exit_with(HostExit::JobFailed,
                         "Job exceeded its memory limit of "
                             + std::to_string(bundle->max_memory_mb) + " MB");
    } catch (const std::exception& e) {
        return exit_with(HostExit::JobFailed, std::string{"Job failed: "} + e.what());
    }

    std::cerr.flush();
    return static_cast<int>(HostExit::Success);
}

}  // namespace jobtier
