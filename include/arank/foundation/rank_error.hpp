#pragma once

/// @file rank_error.hpp
/// @brief Error type carried by RankResult<T>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "arank/foundation/error_code.hpp"

namespace arank::foundation {

/// Error with a categorized code, a human-readable message and optional
/// type-erased context (e.g. the offending index pair).
class RankError {
public:
    RankError() = default;

    explicit RankError(ErrorCode code)
        : code_(code) {}

    RankError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    RankError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context data, or nullptr on type mismatch / absence.
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

} // namespace arank::foundation
