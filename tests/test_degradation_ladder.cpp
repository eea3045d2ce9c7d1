/**
 * @file test_degradation_ladder.cpp
 * @brief Tests for the isolation fallback state machine
 * @date 2025
 */

#include "warden/core/degradation_ladder.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace warden::core;

namespace {

std::optional<IsolationLevel> FailTimes(DegradationLadder& ladder, IsolationLevel requested, int n) {
    std::optional<IsolationLevel> last;
    for (int i = 0; i < n; ++i) {
        last = ladder.RecordFailure(requested);
    }
    return last;
}

} // anonymous namespace

TEST(DegradationLadderTest, StartsAtRequestedLevel) {
    DegradationLadder ladder;
    EXPECT_EQ(ladder.EffectiveLevel(IsolationLevel::MICRO_VM), IsolationLevel::MICRO_VM);
    EXPECT_EQ(ladder.ConsecutiveFailures(IsolationLevel::MICRO_VM), 0);
    EXPECT_FALSE(ladder.IsExhausted(IsolationLevel::MICRO_VM));
    EXPECT_TRUE(ladder.History().empty());
}

TEST(DegradationLadderTest, StepsDownAfterThreshold) {
    DegradationLadder ladder(10);

    EXPECT_FALSE(FailTimes(ladder, IsolationLevel::CONTAINER, 9).has_value());
    EXPECT_EQ(ladder.EffectiveLevel(IsolationLevel::CONTAINER), IsolationLevel::CONTAINER);
    EXPECT_EQ(ladder.ConsecutiveFailures(IsolationLevel::CONTAINER), 9);

    auto stepped = ladder.RecordFailure(IsolationLevel::CONTAINER);
    ASSERT_TRUE(stepped.has_value());
    EXPECT_EQ(*stepped, IsolationLevel::NAMESPACE_SANDBOX);
    EXPECT_EQ(ladder.EffectiveLevel(IsolationLevel::CONTAINER), IsolationLevel::NAMESPACE_SANDBOX);
    EXPECT_EQ(ladder.ConsecutiveFailures(IsolationLevel::CONTAINER), 0);

    auto history = ladder.History();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].requested, IsolationLevel::CONTAINER);
    EXPECT_EQ(history[0].from, IsolationLevel::CONTAINER);
    EXPECT_EQ(history[0].to, IsolationLevel::NAMESPACE_SANDBOX);
    EXPECT_FALSE(history[0].reset);
}

TEST(DegradationLadderTest, SuccessClearsFailureStreak) {
    DegradationLadder ladder(3);
    FailTimes(ladder, IsolationLevel::CONTAINER, 2);
    ladder.RecordSuccess(IsolationLevel::CONTAINER);
    EXPECT_FALSE(FailTimes(ladder, IsolationLevel::CONTAINER, 2).has_value());
    EXPECT_EQ(ladder.EffectiveLevel(IsolationLevel::CONTAINER), IsolationLevel::CONTAINER);
}

TEST(DegradationLadderTest, NeverRecoversOnItsOwn) {
    DegradationLadder ladder(1);
    ladder.RecordFailure(IsolationLevel::MICRO_VM);
    ladder.RecordSuccess(IsolationLevel::MICRO_VM);
    ladder.RecordSuccess(IsolationLevel::MICRO_VM);

    EXPECT_EQ(ladder.EffectiveLevel(IsolationLevel::MICRO_VM), IsolationLevel::USERSPACE_KERNEL);
}

TEST(DegradationLadderTest, StatePerRequestedLevel) {
    DegradationLadder ladder(1);
    ladder.RecordFailure(IsolationLevel::MICRO_VM);

    EXPECT_EQ(ladder.EffectiveLevel(IsolationLevel::MICRO_VM), IsolationLevel::USERSPACE_KERNEL);
    EXPECT_EQ(ladder.EffectiveLevel(IsolationLevel::CONTAINER), IsolationLevel::CONTAINER);
}

TEST(DegradationLadderTest, ExhaustsAtFloor) {
    DegradationLadder ladder(2, IsolationLevel::NAMESPACE_SANDBOX);

    EXPECT_EQ(FailTimes(ladder, IsolationLevel::CONTAINER, 2), IsolationLevel::NAMESPACE_SANDBOX);
    EXPECT_FALSE(FailTimes(ladder, IsolationLevel::CONTAINER, 2).has_value());
    EXPECT_TRUE(ladder.IsExhausted(IsolationLevel::CONTAINER));
    EXPECT_EQ(ladder.EffectiveLevel(IsolationLevel::CONTAINER), IsolationLevel::NAMESPACE_SANDBOX);

    ladder.RecordSuccess(IsolationLevel::CONTAINER);
    EXPECT_FALSE(ladder.IsExhausted(IsolationLevel::CONTAINER));
}

TEST(DegradationLadderTest, WalksToAstOnlyWhenAllowed) {
    DegradationLadder ladder(1);
    EXPECT_EQ(ladder.RecordFailure(IsolationLevel::MICRO_VM), IsolationLevel::USERSPACE_KERNEL);
    EXPECT_EQ(ladder.RecordFailure(IsolationLevel::MICRO_VM), IsolationLevel::CONTAINER);
    EXPECT_EQ(ladder.RecordFailure(IsolationLevel::MICRO_VM), IsolationLevel::NAMESPACE_SANDBOX);
    EXPECT_EQ(ladder.RecordFailure(IsolationLevel::MICRO_VM), IsolationLevel::NONE_AST_ONLY);
    EXPECT_FALSE(ladder.RecordFailure(IsolationLevel::MICRO_VM).has_value());
    EXPECT_TRUE(ladder.IsExhausted(IsolationLevel::MICRO_VM));
    EXPECT_EQ(ladder.History().size(), 4u);
}

TEST(DegradationLadderTest, ResetRestoresRequestedLevel) {
    DegradationLadder ladder(1);
    EXPECT_FALSE(ladder.Reset(IsolationLevel::CONTAINER));

    ladder.RecordFailure(IsolationLevel::CONTAINER);
    EXPECT_TRUE(ladder.Reset(IsolationLevel::CONTAINER));
    EXPECT_EQ(ladder.EffectiveLevel(IsolationLevel::CONTAINER), IsolationLevel::CONTAINER);
    EXPECT_FALSE(ladder.Reset(IsolationLevel::CONTAINER));

    auto history = ladder.History();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_TRUE(history[1].reset);
    EXPECT_EQ(history[1].from, IsolationLevel::NAMESPACE_SANDBOX);
    EXPECT_EQ(history[1].to, IsolationLevel::CONTAINER);
}

TEST(DegradationLadderTest, ThresholdCanChange) {
    DegradationLadder ladder(10);
    ladder.SetFailureThreshold(2);
    EXPECT_FALSE(ladder.RecordFailure(IsolationLevel::CONTAINER).has_value());
    EXPECT_TRUE(ladder.RecordFailure(IsolationLevel::CONTAINER).has_value());

    ladder.SetFailureThreshold(0);
    EXPECT_TRUE(ladder.RecordFailure(IsolationLevel::CONTAINER).has_value());
}

TEST(DegradationLadderTest, ConcurrentFailuresStepOncePerThreshold) {
    DegradationLadder ladder(10);

    std::vector<std::thread> threads;
    for (int t = 0; t < 5; ++t) {
        threads.emplace_back([&ladder]() {
            for (int i = 0; i < 4; ++i) {
                ladder.RecordFailure(IsolationLevel::CONTAINER);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(ladder.History().size(), 2u);
    EXPECT_EQ(ladder.EffectiveLevel(IsolationLevel::CONTAINER), IsolationLevel::NONE_AST_ONLY);
}
