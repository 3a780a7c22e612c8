/**
 * @file generate_report_job.cpp
 * @brief GenerateReportJob — writes a CSV summary to disk.
 *
 * File output puts it in the pooled tier.
 */

#include "app/example_jobs.hpp"

#include <cmath>
#include <fstream>
#include <string>

namespace jobtier {

namespace {

class GenerateReportJob : public Job {
public:
    explicit GenerateReportJob(JobOptions options) : Job(std::move(options)) {}

    [[nodiscard]] std::string_view type_name() const noexcept override {
        return "GenerateReportJob";
    }

    [[nodiscard]] std::optional<std::filesystem::path> source_path() const override {
        return std::filesystem::path{__FILE__};
    }

    Result<void> execute() override {
        if (output_path_.empty()) {
            return Error{ErrorCode::ExecutionFailure, "No output path configured"};
        }

        std::ofstream out(output_path_, std::ios::trunc);
        if (!out.is_open()) {
            return Error{ErrorCode::Io, "Cannot open report output " + output_path_};
        }

        out << "row,value\n";
        double total = 0.0;
        for (int64_t i = 0; i < rows_; ++i) {
            const double value = std::sin(static_cast<double>(i)) * 100.0;
            total += value;
            out << i << ',' << value << '\n';
        }
        out << "total," << total << '\n';

        if (!out.good()) {
            return Error{ErrorCode::Io, "Failed writing report " + output_path_};
        }
        return Result<void>{};
    }

    [[nodiscard]] nlohmann::json save_fields() const override {
        return {{"rows", rows_}, {"output_path", output_path_}};
    }

    Result<void> load_fields(const nlohmann::json& fields) override {
        if (!fields.is_object()) {
            return Error{ErrorCode::Validation, "GenerateReportJob fields must be an object"};
        }
        for (const auto& item : fields.items()) {
            if (item.key() == "rows" && item.value().is_number_integer()) {
                rows_ = item.value().get<int64_t>();
            } else if (item.key() == "output_path" && item.value().is_string()) {
                output_path_ = item.value().get<std::string>();
            } else {
                return Error{ErrorCode::Validation,
                             "GenerateReportJob rejects field '" + item.key() + "'"};
            }
        }
        if (rows_ < 0) {
            return Error{ErrorCode::Validation, "GenerateReportJob rows must be non-negative"};
        }
        return Result<void>{};
    }

private:
    int64_t rows_{1000};
    std::string output_path_;
};

}  // anonymous namespace

Result<void> register_generate_report_job(JobRegistry& registry) {
    return registry.add<GenerateReportJob>("GenerateReportJob");
}

}  // namespace jobtier
