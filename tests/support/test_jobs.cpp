/**
 * @file test_jobs.cpp
 * @brief Job bodies shared by the unit tests and jobtier_test_host.
 */

#include "support/test_jobs.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include <unistd.h>

namespace jobtier::test {

Result<void> FailJob::execute() {
    return Error{ErrorCode::ExecutionFailure, std::string{kMessage}};
}

Result<void> ThrowJob::execute() {
    throw std::runtime_error("boom in /home/build/jobs/throw_job.cpp");
}

// ── SleepJob ─────────────────────────────────

Result<void> SleepJob::execute() {
    if (!pid_file_.empty()) {
        std::ofstream out(pid_file_, std::ios::trunc);
        out << ::getpid() << '\n';
    }
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds_));
    return Result<void>{};
}

nlohmann::json SleepJob::save_fields() const {
    return {{"seconds", seconds_}, {"pid_file", pid_file_}};
}

Result<void> SleepJob::load_fields(const nlohmann::json& fields) {
    if (fields.contains("seconds")) {
        if (!fields["seconds"].is_number()) {
            return Error{ErrorCode::Validation, "seconds must be a number"};
        }
        seconds_ = fields["seconds"].get<double>();
    }
    if (fields.contains("pid_file")) {
        if (!fields["pid_file"].is_string()) {
            return Error{ErrorCode::Validation, "pid_file must be a string"};
        }
        pid_file_ = fields["pid_file"].get<std::string>();
    }
    return Result<void>{};
}

// ── EchoFieldsJob ────────────────────────────

Result<void> EchoFieldsJob::execute() {
    if (output_path_.empty()) {
        return Error{ErrorCode::ExecutionFailure, "No output path"};
    }
    nlohmann::json echo = {
        {"type", std::string{type_name()}},
        {"id", id()},
        {"timeout_s", timeout_seconds()},
        {"max_memory_mb", max_memory_mb()},
        {"priority", priority()},
        {"isolated", isolation().value_or(false)},
        {"fields", save_fields()},
    };
    std::ofstream out(output_path_, std::ios::trunc);
    out << echo.dump();
    if (!out.good()) {
        return Error{ErrorCode::Io, "Cannot write echo output"};
    }
    return Result<void>{};
}

nlohmann::json EchoFieldsJob::save_fields() const {
    return {{"payload", payload_}, {"output_path", output_path_}};
}

Result<void> EchoFieldsJob::load_fields(const nlohmann::json& fields) {
    for (const auto& item : fields.items()) {
        if (item.key() == "payload") {
            payload_ = item.value();
        } else if (item.key() == "output_path" && item.value().is_string()) {
            output_path_ = item.value().get<std::string>();
        } else {
            return Error{ErrorCode::Validation, "EchoFieldsJob rejects field '" + item.key() + "'"};
        }
    }
    return Result<void>{};
}

// ── AllocateJob ──────────────────────────────

Result<void> AllocateJob::execute() {
    std::vector<char> block(static_cast<size_t>(megabytes_) * 1024 * 1024);
    std::memset(block.data(), 0x5a, block.size());
    return Result<void>{};
}

nlohmann::json AllocateJob::save_fields() const {
    return {{"megabytes", megabytes_}};
}

Result<void> AllocateJob::load_fields(const nlohmann::json& fields) {
    if (!fields.contains("megabytes") || !fields["megabytes"].is_number_unsigned()) {
        return Error{ErrorCode::Validation, "megabytes must be an unsigned integer"};
    }
    megabytes_ = fields["megabytes"].get<uint32_t>();
    return Result<void>{};
}

// ── CrashJob ─────────────────────────────────

Result<void> CrashJob::execute() {
    std::abort();
}

void register_test_jobs(JobRegistry& registry) {
    (void)registry.add<SucceedJob>("SucceedJob");
    (void)registry.add<FailJob>("FailJob");
    (void)registry.add<ThrowJob>("ThrowJob");
    (void)registry.add<SleepJob>("SleepJob");
    (void)registry.add<EchoFieldsJob>("EchoFieldsJob");
    (void)registry.add<AllocateJob>("AllocateJob");
    (void)registry.add<CrashJob>("CrashJob");
}

}  // namespace jobtier::test
