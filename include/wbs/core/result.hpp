#pragma once

/// @file result.hpp
/// @brief Result<T,E> type for explicit error propagation without exceptions.

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace wbs {

/// Minimal error payload used when no richer error type is required.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Holds either a success value of type T or an error of type E.
///
/// Simulation code never throws on the hot path; every operation that can
/// hit a configuration fault returns a Result so the batch driver can abort
/// on the first failure.
///
/// Example:
/// @code
///   auto expr = dice::parseDiceExpression("2d6+1");
///   if (!expr) {
///       return SimResult<int>::err(expr.error());
///   }
///   int max = expr.value().maximum();
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(data_)); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload)
        : data_(tag, std::forward<U>(payload)) {}

    // Index-based storage so that T and E may be the same type.
    std::variant<T, E> data_;
};

/// Specialization for operations that only report success or failure.
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    [[nodiscard]] const E& error() const& { return *error_; }
    [[nodiscard]] E&& error() && { return std::move(*error_); }

private:
    Result() = default;
    explicit Result(E error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

} // namespace wbs
