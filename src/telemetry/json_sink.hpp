/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace jobtier {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The active file is `<log_dir>/<prefix>.ndjson`. When it grows past the size
 * limit it becomes `<prefix>.1.ndjson`, older files shift up, and anything
 * beyond `max_files` is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    /// Byte threshold override (tests use tiny files).
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

    [[nodiscard]] std::filesystem::path current_path() const;
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

private:
    void rotate_if_needed();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout — useful for development/debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output — useful for benchmarking.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/**
 * @brief Keeps every line in memory. Shared ownership of the buffer lets a
 *        test inspect output after handing the sink to a Logger.
 */
class MemorySink : public ILogSink {
public:
    struct Buffer {
        std::mutex mutex;
        std::vector<std::string> lines;
    };

    MemorySink();
    explicit MemorySink(std::shared_ptr<Buffer> buffer);

    void write(std::string_view json_line) override;
    void flush() override {}

    [[nodiscard]] std::shared_ptr<Buffer> buffer() const { return buffer_; }
    [[nodiscard]] std::vector<std::string> lines() const;

private:
    std::shared_ptr<Buffer> buffer_;
};

}  // namespace jobtier
