#include <gtest/gtest.h>
#include "upload/model/ErrorBudget.hpp"
#include "upload/model/RunResult.hpp"

using namespace lb::upload::model;

TEST(ErrorBudgetTest, PercentageRoundsUp) {
    const ErrorBudget b{2.0, std::nullopt};
    EXPECT_EQ(b.allowedFor(10), 1u);
    EXPECT_EQ(b.allowedFor(50), 1u);
    EXPECT_EQ(b.allowedFor(51), 2u);
    EXPECT_EQ(b.allowedFor(100), 2u);
    EXPECT_EQ(b.allowedFor(101), 3u);
}

TEST(ErrorBudgetTest, NoCandidatesNoBudget) {
    EXPECT_EQ(ErrorBudget{}.allowedFor(0), 0u);
}

TEST(ErrorBudgetTest, ZeroPercentToleratesNothing) {
    const ErrorBudget b{0.0, std::nullopt};
    EXPECT_EQ(b.allowedFor(1000), 0u);
}

TEST(ErrorBudgetTest, AbsoluteCapReplacesPercentage) {
    const ErrorBudget b{2.0, 7u};
    EXPECT_EQ(b.allowedFor(10), 7u);
    EXPECT_EQ(b.allowedFor(100000), 7u);
}

TEST(ErrorBudgetTest, ExceededOnlyAboveBudget) {
    EXPECT_FALSE(ErrorBudget::exceeded(0, 0));
    EXPECT_TRUE(ErrorBudget::exceeded(1, 0));
    EXPECT_FALSE(ErrorBudget::exceeded(2, 2));
    EXPECT_TRUE(ErrorBudget::exceeded(3, 2));
}

TEST(RunResultTest, ExitCodeDistinguishesAbort) {
    RunResult r;
    r.phase = Phase::Completed;
    r.failed = 1;
    EXPECT_EQ(r.exitCode(), 0);

    r.phase = Phase::Aborted;
    r.reason = AbortReason::CancellationRequested;
    EXPECT_EQ(r.exitCode(), 1);
    EXPECT_NE(r.summary().find("cancellation requested"), std::string::npos);
}
