#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "wbs/foundation/error_code.hpp"
#include "wbs/foundation/sim_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace wbs::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::GlobalLoggerRegistry;

// ---------------------------------------------------------------------------
// MockLogger: captures log messages for assertion
// ---------------------------------------------------------------------------

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level /*level*/) const override { return true; }

    kcenon::common::VoidResult set_level(log_level /*level*/) override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return log_level::trace; }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    bool wasFlushed() const { return flushed_.load(std::memory_order_acquire); }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<bool> flushed_{false};
};

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class SimLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// Names and parsing
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(LogCategory::Dice), "Dice");
    EXPECT_EQ(logCategoryName(LogCategory::Combat), "Combat");
    EXPECT_EQ(logCategoryName(LogCategory::Metrics), "Metrics");
    EXPECT_EQ(logCategoryName(LogCategory::Analysis), "Analysis");
    EXPECT_EQ(logCategoryName(LogCategory::Simulation), "Simulation");
    EXPECT_EQ(kLogCategoryCount, 7u);
}

TEST(LogLevelTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

// ---------------------------------------------------------------------------
// Level filtering
// ---------------------------------------------------------------------------

TEST(SimLoggerBasicTest, DefaultCategoryLevels) {
    SimLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Dice), LogLevel::Warning);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Combat), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Simulation), LogLevel::Info);
}

TEST(SimLoggerBasicTest, SetAllLevels) {
    SimLogger logger;
    logger.setAllLevels(LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Core));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Simulation));
}

TEST(SimLoggerBasicTest, InvalidCategoryReturnsOff) {
    SimLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Logging through the kcenon registry
// ---------------------------------------------------------------------------

TEST_F(SimLoggerTest, LogFormatsMessageWithCategory) {
    SimLogger logger;
    logger.log(LogLevel::Info, LogCategory::Simulation, "Batch started");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Simulation] Batch started");
}

TEST_F(SimLoggerTest, LogFiltersMessagesBelowLevel) {
    SimLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Dice, "rolled 4");
    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(SimLoggerTest, LogWithContextIncludesFields) {
    SimLogger logger;
    logger.setCategoryLevel(LogCategory::Combat, LogLevel::Debug);

    LogContext ctx;
    ctx.combatId = 17;
    ctx.weapon = "Sanguine Messer";
    ctx.seed = 42;
    ctx.extra["counter"] = "9";

    logger.logWithContext(LogLevel::Debug, LogCategory::Combat, "Bleed counter advanced", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Combat] Bleed counter advanced {"), std::string::npos);
    EXPECT_NE(msg.find("combat_id=17"), std::string::npos);
    EXPECT_NE(msg.find("weapon=Sanguine Messer"), std::string::npos);
    EXPECT_NE(msg.find("seed=42"), std::string::npos);
    EXPECT_NE(msg.find("counter=9"), std::string::npos);
}

TEST_F(SimLoggerTest, LogWithEmptyContextOmitsBraces) {
    SimLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "Starting", LogContext{});

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] Starting");
}

TEST_F(SimLoggerTest, FlushDelegatesToLogger) {
    SimLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

TEST_F(SimLoggerTest, MacroLogsWhenEnabled) {
    SimLogger::instance().setCategoryLevel(LogCategory::Analysis, LogLevel::Info);
    WBS_LOG_INFO(LogCategory::Analysis, "analysis done");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Analysis] analysis done");
}

TEST_F(SimLoggerTest, ConcurrentLoggingIsSafe) {
    SimLogger logger;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger] {
            for (int i = 0; i < kPerThread; ++i) {
                logger.log(LogLevel::Info, LogCategory::Simulation, "combat finished");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(mockLogger_->records().size(), static_cast<std::size_t>(kThreads * kPerThread));
}
