/**
 * @file result.hpp
 * @brief Monadic error handling type for jobtier.
 *
 * Provides Result<T, E> as the primary error-handling mechanism, avoiding
 * exceptions on library paths. Errors carry an ErrorCode so callers can tell
 * admission-control rejections from validation or security failures.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <optional>
#include <type_traits>
#include <utility>
#include <stdexcept>

namespace jobtier {

/**
 * @brief Error taxonomy shared by every module.
 */
enum class ErrorCode : uint8_t {
    Generic,
    Validation,                 ///< Bad job properties, job never runs
    Security,                   ///< Disallowed source location, caught before spawn
    ConcurrencyLimitExceeded,   ///< Admission control: ceiling reached
    RateLimitExceeded,          ///< Admission control: too many dispatches per minute
    ExecutionFailure,           ///< Job body failed
    TimeoutFailure,             ///< Job was killed after its timeout
    ShuttingDown,               ///< Runtime no longer accepts work
    Config,                     ///< Configuration could not be loaded or is invalid
    Io                          ///< Filesystem / process plumbing failed
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic:                  return "error";
        case ErrorCode::Validation:               return "validation_error";
        case ErrorCode::Security:                 return "security_error";
        case ErrorCode::ConcurrencyLimitExceeded: return "concurrency_limit_exceeded";
        case ErrorCode::RateLimitExceeded:        return "rate_limit_exceeded";
        case ErrorCode::ExecutionFailure:         return "execution_failure";
        case ErrorCode::TimeoutFailure:           return "timeout_failure";
        case ErrorCode::ShuttingDown:             return "shutting_down";
        case ErrorCode::Config:                   return "config_error";
        case ErrorCode::Io:                       return "io_error";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code{ErrorCode::Generic};
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }
};

/**
 * @brief Result<T, E> — a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 *
 * Used when an operation can fail but has no return value on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace jobtier
