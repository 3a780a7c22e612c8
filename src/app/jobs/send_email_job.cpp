/**
 * @file send_email_job.cpp
 * @brief SendEmailJob — composes a notification message.
 *
 * Pure string work; the analyzer finds no blocking calls and runs it inline.
 */

#include "app/example_jobs.hpp"

#include <string>

namespace jobtier {

namespace {

class SendEmailJob : public Job {
public:
    explicit SendEmailJob(JobOptions options) : Job(std::move(options)) {}

    [[nodiscard]] std::string_view type_name() const noexcept override { return "SendEmailJob"; }

    [[nodiscard]] std::optional<std::filesystem::path> source_path() const override {
        return std::filesystem::path{__FILE__};
    }

    Result<void> execute() override {
        const auto at = recipient_.find('@');
        if (at == std::string::npos || at == 0 || at + 1 == recipient_.size()) {
            return Error{ErrorCode::ExecutionFailure, "Invalid recipient address"};
        }
        if (subject_.empty()) {
            return Error{ErrorCode::ExecutionFailure, "Message subject is empty"};
        }

        message_ = "To: " + recipient_ + "\r\nSubject: " + subject_ + "\r\n\r\n" + body_;
        return Result<void>{};
    }

    [[nodiscard]] nlohmann::json save_fields() const override {
        return {{"recipient", recipient_}, {"subject", subject_}, {"body", body_}};
    }

    Result<void> load_fields(const nlohmann::json& fields) override {
        if (!fields.is_object()) {
            return Error{ErrorCode::Validation, "SendEmailJob fields must be an object"};
        }
        for (const auto& item : fields.items()) {
            if (!item.value().is_string()) {
                return Error{ErrorCode::Validation,
                             "SendEmailJob field '" + item.key() + "' must be a string"};
            }
            if (item.key() == "recipient") {
                recipient_ = item.value().get<std::string>();
            } else if (item.key() == "subject") {
                subject_ = item.value().get<std::string>();
            } else if (item.key() == "body") {
                body_ = item.value().get<std::string>();
            } else {
                return Error{ErrorCode::Validation,
                             "SendEmailJob has no field '" + item.key() + "'"};
            }
        }
        return Result<void>{};
    }

private:
    std::string recipient_;
    std::string subject_;
    std::string body_;
    std::string message_;
};

}  // anonymous namespace

Result<void> register_send_email_job(JobRegistry& registry) {
    return registry.add<SendEmailJob>("SendEmailJob");
}

}  // namespace jobtier
