#pragma once

/// @file sim_logger.hpp
/// @brief SimLogger wrapping kcenon common_system logging for the simulator.
///
/// Category-based filtering, structured context and per-category runtime
/// level control. The kcenon logger registry stays hidden behind PIMPL.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "wbs/foundation/sim_result.hpp"

namespace wbs::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Simulator log categories.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Startup, shutdown, version
    Config     = 1, ///< Configuration loading
    Dice       = 2, ///< Dice parsing and rolling
    Combat     = 3, ///< Attack resolution and combat orchestration
    Metrics    = 4, ///< Tracker registry and aggregation
    Analysis   = 5, ///< Statistics and baseline comparison
    Simulation = 6  ///< Batch execution
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Config", "Dice", "Combat", "Metrics", "Analysis", "Simulation"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line as key=value pairs.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.combatId = 17;
///   ctx.weapon = "Sanguine Messer";
///   ctx.extra["counter"] = "9";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Combat,
///                         "Bleed counter advanced", ctx);
/// @endcode
struct LogContext {
    std::optional<int> combatId;
    std::optional<std::string> weapon;
    std::optional<std::string> character;
    std::optional<uint64_t> seed;
    std::unordered_map<std::string, std::string> extra;
};

/// Simulator logger wrapping kcenon's global logger registry.
///
/// Default log levels per category:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Config     | Info          |
/// | Dice       | Warning       |
/// | Combat     | Info          |
/// | Metrics    | Info          |
/// | Analysis   | Info          |
/// | Simulation | Info          |
///
/// Dice and Combat stay quiet by default because they run once per attack
/// across every combat of a batch.
class SimLogger {
public:
    SimLogger();
    ~SimLogger();

    SimLogger(const SimLogger&) = delete;
    SimLogger& operator=(const SimLogger&) = delete;
    SimLogger(SimLogger&&) noexcept;
    SimLogger& operator=(SimLogger&&) noexcept;

    /// Log a message. No-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by "{key=val, ...}" built from @p ctx.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one level to every category.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default kcenon logger.
    SimResult<void> flush();

    static SimLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Parse "trace", "debug", "info", "warning", "error", "critical" or "off".
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text);

} // namespace wbs::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// WBS_MIN_LOG_LEVEL removes calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef WBS_MIN_LOG_LEVEL
    #define WBS_MIN_LOG_LEVEL 0
#endif

#define WBS_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= WBS_MIN_LOG_LEVEL &&                      \
            ::wbs::foundation::SimLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::wbs::foundation::SimLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define WBS_LOG_TRACE(cat, msg) \
    WBS_LOG(::wbs::foundation::LogLevel::Trace, (cat), (msg))

#define WBS_LOG_DEBUG(cat, msg) \
    WBS_LOG(::wbs::foundation::LogLevel::Debug, (cat), (msg))

#define WBS_LOG_INFO(cat, msg) \
    WBS_LOG(::wbs::foundation::LogLevel::Info, (cat), (msg))

#define WBS_LOG_WARN(cat, msg) \
    WBS_LOG(::wbs::foundation::LogLevel::Warning, (cat), (msg))

#define WBS_LOG_ERROR(cat, msg) \
    WBS_LOG(::wbs::foundation::LogLevel::Error, (cat), (msg))
