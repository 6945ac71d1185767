#pragma once

/// @file result.hpp
/// @brief Result<T,E> type for explicit error handling without exceptions.

#include <cstddef>
#include <utility>
#include <variant>

namespace pbt {

/// Value-or-error return type used across the library.
///
/// Public entry points that can fail return Result<T, E> instead of
/// throwing. The error type is supplied by the caller layer; the
/// foundation layer binds it to BudgetError (see budget_result.hpp).
///
/// Example:
/// @code
///   auto config = BudgetingConfig::create(params, clock);
///   if (!config) {
///       report(config.error().message());
///       return;
///   }
///   BudgetTracker tracker(config.value());
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (throws std::bad_variant_access on error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (throws std::bad_variant_access on success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : data_(tag, std::forward<U>(payload)) {}

    // Indexed so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Specialization for operations that only report success or failure.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !failed_; }
    [[nodiscard]] bool hasError() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return !failed_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() = default;
    explicit Result(E error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    E error_;
};

}  // namespace pbt
