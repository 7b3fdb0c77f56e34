#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the weapon balance simulator.

#include <cstdint>
#include <string_view>

namespace wbs::foundation {

/// Error codes grouped by subsystem in 256-value hex ranges.
///
/// Every code except the General range is a configuration fault: the
/// simulation is deterministic, so a fault seen once recurs on every
/// combat with the same parameters and is never retried.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,

    // Dice (0x0200 - 0x02FF)
    MalformedDiceExpression = 0x0200,
    UnsupportedDieSize = 0x0201,

    // Combat (0x0300 - 0x03FF)
    UnknownSizeClass = 0x0300,
    InvalidScenario = 0x0301,
    InvalidWeaponDefinition = 0x0302,
    InvalidCharacter = 0x0303,

    // Metrics (0x0400 - 0x04FF)
    MetricsNotStarted = 0x0400,
    TrackerNotFound = 0x0401,

    // Analysis (0x0500 - 0x05FF)
    EmptyInput = 0x0500,
    NoBaselineForLevel = 0x0501,

    // Thread (0x0600 - 0x06FF)
    ThreadError = 0x0600,
    JobScheduleFailed = 0x0601,
    JobNotFound = 0x0602,
    JobCancelled = 0x0603,

    // Logger (0x0700 - 0x07FF)
    LoggerError = 0x0700,
    LoggerFlushFailed = 0x0701,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    switch (static_cast<uint32_t>(code) & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Dice";
        case 0x0300: return "Combat";
        case 0x0400: return "Metrics";
        case 0x0500: return "Analysis";
        case 0x0600: return "Thread";
        case 0x0700: return "Logger";
        default: return "Unknown";
    }
}

} // namespace wbs::foundation
