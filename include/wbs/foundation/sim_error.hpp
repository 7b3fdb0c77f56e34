#pragma once

/// @file sim_error.hpp
/// @brief Simulator error type used with Result<T, SimError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "wbs/foundation/error_code.hpp"

namespace wbs::foundation {

/// Error carrying a categorized code, a human-readable message and optional
/// type-erased context (for example the offending dice string).
class SimError {
public:
    SimError() = default;

    explicit SimError(ErrorCode code) : code_(code) {}

    SimError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    SimError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context data, or nullptr on type mismatch or when empty.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// "[Subsystem] message", the form written to logs and stderr.
    [[nodiscard]] std::string describe() const {
        std::string out;
        out.reserve(message_.size() + 16);
        out += '[';
        out += subsystem();
        out += "] ";
        out += message_;
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace wbs::foundation
