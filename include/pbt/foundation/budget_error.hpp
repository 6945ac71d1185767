#pragma once

/// @file budget_error.hpp
/// @brief Error type used with Result<T, BudgetError>.

#include <string>
#include <string_view>
#include <utility>

#include "pbt/foundation/error_code.hpp"

namespace pbt::foundation {

/// Error carrying a categorized code and a human-readable message.
class BudgetError {
public:
    BudgetError() = default;

    explicit BudgetError(ErrorCode code)
        : code_(code) {}

    BudgetError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Return a copy whose message is prefixed with `context: `.
    ///
    /// Used when an error crosses a layer that knows more about where it
    /// happened (e.g. the name of the budgeting config being loaded).
    [[nodiscard]] BudgetError withContext(std::string_view context) const {
        std::string msg(context);
        msg += ": ";
        msg += message_;
        return BudgetError(code_, std::move(msg));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace pbt::foundation
