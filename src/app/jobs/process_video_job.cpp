/**
 * @file process_video_job.cpp
 * @brief ProcessVideoExport — transcodes a file by shelling out to ffmpeg.
 */

#include "app/example_jobs.hpp"

#include <cstdio>
#include <string>

#include <sys/wait.h>

namespace jobtier {

namespace {

// Paths end up in a shell command line
bool is_shell_safe(const std::string& value) {
    if (value.empty()) return false;
    for (char c : value) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                     || (c >= '0' && c <= '9') || c == '/' || c == '.' || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

class ProcessVideoExport : public Job {
public:
    explicit ProcessVideoExport(JobOptions options) : Job(std::move(options)) {}

    [[nodiscard]] std::string_view type_name() const noexcept override {
        return "ProcessVideoExport";
    }

    [[nodiscard]] std::optional<std::filesystem::path> source_path() const override {
        return std::filesystem::path{__FILE__};
    }

    Result<void> execute() override {
        if (!is_shell_safe(input_) || !is_shell_safe(output_) || !is_shell_safe(preset_)) {
            return Error{ErrorCode::Validation, "ProcessVideoExport paths must be plain paths"};
        }

        const std::string command = "ffmpeg -nostdin -loglevel error -y -i " + input_
                                  + " -c:v libx264 -preset " + preset_ + " " + output_ + " 2>&1";
        FILE* pipe = popen(command.c_str(), "r");
        if (pipe == nullptr) {
            return Error{ErrorCode::ExecutionFailure, "Could not start ffmpeg"};
        }

        std::string output;
        char buf[256];
        while (std::fgets(buf, sizeof(buf), pipe) != nullptr) {
            if (output.size() < 4096) output += buf;
        }

        const int status = pclose(pipe);
        if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            return Error{ErrorCode::ExecutionFailure, "ffmpeg failed: " + output};
        }
        return Result<void>{};
    }

    [[nodiscard]] nlohmann::json save_fields() const override {
        return {{"input", input_}, {"output", output_}, {"preset", preset_}};
    }

    Result<void> load_fields(const nlohmann::json& fields) override {
        if (!fields.is_object()) {
            return Error{ErrorCode::Validation, "ProcessVideoExport fields must be an object"};
        }
        for (const auto& item : fields.items()) {
            if (!item.value().is_string()) {
                return Error{ErrorCode::Validation,
                             "ProcessVideoExport field '" + item.key() + "' must be a string"};
            }
            if (item.key() == "input") {
                input_ = item.value().get<std::string>();
            } else if (item.key() == "output") {
                output_ = item.value().get<std::string>();
            } else if (item.key() == "preset") {
                preset_ = item.value().get<std::string>();
            } else {
                return Error{ErrorCode::Validation,
                             "ProcessVideoExport has no field '" + item.key() + "'"};
            }
        }
        return Result<void>{};
    }

private:
    std::string input_;
    std::string output_;
    std::string preset_{"veryfast"};
};

}  // anonymous namespace

Result<void> register_process_video_job(JobRegistry& registry) {
    return registry.add<ProcessVideoExport>("ProcessVideoExport");
}

}  // namespace jobtier
