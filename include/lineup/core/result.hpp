#pragma once

/// @file result.hpp
/// @brief Result<T,E> type for explicit error handling without exceptions.

#include <cstddef>
#include <utility>
#include <variant>

namespace lineup {

/// Result type for explicit error propagation.
///
/// Every function in lineup that can fail returns Result<T, E> instead of
/// throwing. "Nothing to do" outcomes (such as no match being formable)
/// are modelled with std::optional, not with an error.
///
/// @tparam T The success value type.
/// @tparam E The error type.
///
/// Example:
/// @code
///   auto system = MatchmakingSystem::create(config);
///   if (!system) {
///       std::cerr << system.error().message() << "\n";
///       return EXIT_FAILURE;
///   }
///   auto& mm = system.value();
/// @endcode
template <typename T, typename E>
class Result {
public:
    /// Construct a success result.
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    /// Construct an error result.
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    /// True on success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (throws std::bad_variant_access on error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (throws std::bad_variant_access on success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    /// Access value or return a default.
    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : data_(tag, std::forward<U>(v)) {}

    // Index-based storage so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Specialization for void success type.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace lineup
