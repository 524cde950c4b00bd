#pragma once

/// @file service_error.hpp
/// @brief Service error type used with Result<T, ServiceError>.

#include <string>
#include <string_view>
#include <utility>

#include "lcs/foundation/error_code.hpp"

namespace lcs::foundation {

/// Error carrying a categorized code, a short human-readable reason, and
/// optionally the property key or team name that caused the failure.
class ServiceError {
public:
    ServiceError() = default;

    explicit ServiceError(ErrorCode code)
        : code_(code) {}

    ServiceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ServiceError(ErrorCode code, std::string message, std::string subject)
        : code_(code), message_(std::move(message)), subject_(std::move(subject)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable reason, suitable for a response.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The key, team or factory id the error refers to (may be empty).
    [[nodiscard]] std::string_view subject() const noexcept { return subject_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Taxonomy class used to pick the response status.
    [[nodiscard]] ErrorKind kind() const noexcept { return errorKind(code_); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::string subject_;
};

} // namespace lcs::foundation
