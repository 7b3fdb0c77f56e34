#include <gtest/gtest.h>

#include <string>

#include "wbs/foundation/error_code.hpp"
#include "wbs/foundation/sim_error.hpp"
#include "wbs/foundation/sim_result.hpp"

using namespace wbs::foundation;

// ---------------------------------------------------------------------------
// ErrorCode subsystem lookup
// ---------------------------------------------------------------------------

TEST(ErrorCodeTest, SubsystemRanges) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::MalformedDiceExpression), "Dice");
    EXPECT_EQ(errorSubsystem(ErrorCode::UnsupportedDieSize), "Dice");
    EXPECT_EQ(errorSubsystem(ErrorCode::UnknownSizeClass), "Combat");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidScenario), "Combat");
    EXPECT_EQ(errorSubsystem(ErrorCode::MetricsNotStarted), "Metrics");
    EXPECT_EQ(errorSubsystem(ErrorCode::EmptyInput), "Analysis");
    EXPECT_EQ(errorSubsystem(ErrorCode::JobScheduleFailed), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

// ---------------------------------------------------------------------------
// SimError
// ---------------------------------------------------------------------------

TEST(SimErrorTest, DefaultIsUnknown) {
    SimError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(SimErrorTest, DescribePrefixesSubsystem) {
    SimError err(ErrorCode::UnknownSizeClass, "unknown size class: colossal");
    EXPECT_EQ(err.subsystem(), "Combat");
    EXPECT_EQ(err.describe(), "[Combat] unknown size class: colossal");
}

TEST(SimErrorTest, TypedContext) {
    SimError err(ErrorCode::MalformedDiceExpression, "bad dice", std::string("2x6"));
    ASSERT_TRUE(err.hasContext());
    const auto* text = err.context<std::string>();
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(*text, "2x6");
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(SimResultTest, CarriesSimError) {
    auto result = SimResult<int>::err(SimError(ErrorCode::EmptyInput, "empty"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::EmptyInput);

    auto ok = SimResult<void>::ok();
    EXPECT_TRUE(ok.hasValue());
}
