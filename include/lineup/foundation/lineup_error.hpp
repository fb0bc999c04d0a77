#pragma once

/// @file lineup_error.hpp
/// @brief Error type used with Result<T, LineupError>.

#include <string>
#include <string_view>
#include <utility>

#include "lineup/foundation/error_code.hpp"

namespace lineup::foundation {

/// Error carrying a categorized code and a human-readable message.
class LineupError {
public:
    LineupError() = default;

    explicit LineupError(ErrorCode code)
        : code_(code) {}

    LineupError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace lineup::foundation
