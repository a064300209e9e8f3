#pragma once

/// @file rating_error.hpp
/// @brief Error type used with Result<T, RatingError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "crs/foundation/error_code.hpp"

namespace crs::foundation {

/// Error code plus a human-readable message and optional context
/// (for example the offending line number of a games file).
class RatingError {
public:
    RatingError() = default;

    explicit RatingError(ErrorCode code)
        : code_(code) {}

    RatingError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    RatingError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr if empty or of another type).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace crs::foundation
