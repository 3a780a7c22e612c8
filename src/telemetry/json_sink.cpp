/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>

namespace jobtier {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                            const std::string& prefix,
                            uint32_t max_file_size_mb,
                            uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    auto path = current_path();
    current_size_ = std::filesystem::exists(path, ec) ? std::filesystem::file_size(path, ec) : 0;
    if (ec) current_size_ = 0;
    current_file_.open(path, std::ios::app);
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::current_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path JsonFileSink::rotated_path(uint32_t index) const {
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed() {
    if (current_size_ < max_file_size_bytes_) return;

    current_file_.close();
    std::error_code ec;

    if (max_files_ == 0) {
        std::filesystem::remove(current_path(), ec);
    } else {
        std::filesystem::remove(rotated_path(max_files_), ec);
        for (uint32_t i = max_files_; i > 1; --i) {
            auto from = rotated_path(i - 1);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, rotated_path(i), ec);
            }
        }
        std::filesystem::rename(current_path(), rotated_path(1), ec);
    }

    current_file_.open(current_path(), std::ios::trunc);
    current_size_ = 0;
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

// ── MemorySink ───────────────────────────────

MemorySink::MemorySink() : buffer_(std::make_shared<Buffer>()) {}

MemorySink::MemorySink(std::shared_ptr<Buffer> buffer) : buffer_(std::move(buffer)) {}

void MemorySink::write(std::string_view json_line) {
    std::lock_guard lock(buffer_->mutex);
    buffer_->lines.emplace_back(json_line);
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard lock(buffer_->mutex);
    return buffer_->lines;
}

}  // namespace jobtier
