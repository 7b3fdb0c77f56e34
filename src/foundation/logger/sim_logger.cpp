/// @file sim_logger.cpp
/// @brief SimLogger implementation on top of kcenon common_system.

#include "wbs/foundation/sim_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace wbs::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: WBS -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Info,     // Config
    LogLevel::Warning,  // Dice
    LogLevel::Info,     // Combat
    LogLevel::Info,     // Metrics
    LogLevel::Info,     // Analysis
    LogLevel::Info      // Simulation
};

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.combatId) {
        append("combat_id", std::to_string(*ctx.combatId));
    }
    if (ctx.weapon && !ctx.weapon->empty()) {
        append("weapon", *ctx.weapon);
    }
    if (ctx.character && !ctx.character->empty()) {
        append("character", *ctx.character);
    }
    if (ctx.seed) {
        append("seed", std::to_string(*ctx.seed));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct SimLogger::Impl {
    // Atomic so worker threads can check levels without locking.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("wbs.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        auto& registry = kci::GlobalLoggerRegistry::instance();
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        // A registered per-category logger wins; an unregistered name yields
        // the null logger, in which case the default logger is used.
        auto logger = registry.get_logger(loggerNames[idx]);
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
SimLogger::SimLogger() : impl_(std::make_unique<Impl>()) {}

SimLogger::~SimLogger() = default;

SimLogger::SimLogger(SimLogger&&) noexcept = default;
SimLogger& SimLogger::operator=(SimLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log() / logWithContext()
// ---------------------------------------------------------------------------
void SimLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }

    // Format: [Category] message
    std::string formatted;
    formatted.reserve(msg.size() + 16);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;

    // Logging is best effort; a failing sink must not abort a batch.
    static_cast<void>(impl_->getLogger(cat)->log(mapLevel(level), formatted));
}

void SimLogger::logWithContext(LogLevel level, LogCategory cat,
                               std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    std::string ctxStr = formatContext(ctx);

    // Format: [Category] message {key=val, ...}
    std::string formatted;
    formatted.reserve(msg.size() + ctxStr.size() + 20);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }

    static_cast<void>(impl_->getLogger(cat)->log(mapLevel(level), formatted));
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void SimLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

void SimLogger::setAllLevels(LogLevel minLevel) {
    for (auto& level : impl_->categoryLevels) {
        level.store(minLevel, std::memory_order_release);
    }
}

LogLevel SimLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool SimLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

// ---------------------------------------------------------------------------
// flush()
// ---------------------------------------------------------------------------
SimResult<void> SimLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return SimResult<void>::err(
            SimError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return SimResult<void>::ok();
}

SimLogger& SimLogger::instance() {
    static SimLogger inst;
    return inst;
}

// ---------------------------------------------------------------------------
// parseLogLevel()
// ---------------------------------------------------------------------------
std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

} // namespace wbs::foundation
