// File: tests/review/pattern_lifecycle_test.cpp
#include "review/pattern_lifecycle.hpp"
#include <gtest/gtest.h>

namespace recur {
namespace {

RecurringChargePattern CreatePattern() {
    return RecurringChargePattern(PatternID::Generate(), "user-1", {"tx-1", "tx-2", "tx-3"});
}

TEST(PatternLifecycleTest, TransitionTable) {
    EXPECT_TRUE(PatternLifecycle::IsAllowed(PatternStatus::DETECTED, PatternStatus::CONFIRMED));
    EXPECT_TRUE(PatternLifecycle::IsAllowed(PatternStatus::DETECTED, PatternStatus::REJECTED));
    EXPECT_TRUE(PatternLifecycle::IsAllowed(PatternStatus::CONFIRMED, PatternStatus::ACTIVE));
    EXPECT_TRUE(PatternLifecycle::IsAllowed(PatternStatus::CONFIRMED, PatternStatus::REJECTED));
    EXPECT_TRUE(PatternLifecycle::IsAllowed(PatternStatus::ACTIVE, PatternStatus::PAUSED));
    EXPECT_TRUE(PatternLifecycle::IsAllowed(PatternStatus::PAUSED, PatternStatus::ACTIVE));

    EXPECT_FALSE(PatternLifecycle::IsAllowed(PatternStatus::DETECTED, PatternStatus::ACTIVE));
    EXPECT_FALSE(PatternLifecycle::IsAllowed(PatternStatus::ACTIVE, PatternStatus::REJECTED));
    EXPECT_FALSE(PatternLifecycle::IsAllowed(PatternStatus::REJECTED, PatternStatus::DETECTED));
    EXPECT_FALSE(PatternLifecycle::IsAllowed(PatternStatus::PAUSED, PatternStatus::CONFIRMED));
    EXPECT_EQ(6u, PatternLifecycle::Transitions().size());
}

TEST(PatternLifecycleTest, OnlyRejectedIsTerminal) {
    EXPECT_TRUE(PatternLifecycle::IsTerminal(PatternStatus::REJECTED));
    EXPECT_FALSE(PatternLifecycle::IsTerminal(PatternStatus::DETECTED));
    EXPECT_FALSE(PatternLifecycle::IsTerminal(PatternStatus::CONFIRMED));
    EXPECT_FALSE(PatternLifecycle::IsTerminal(PatternStatus::ACTIVE));
    EXPECT_FALSE(PatternLifecycle::IsTerminal(PatternStatus::PAUSED));
}

TEST(PatternLifecycleTest, Reviewable) {
    EXPECT_TRUE(PatternLifecycle::IsReviewable(PatternStatus::DETECTED));
    EXPECT_TRUE(PatternLifecycle::IsReviewable(PatternStatus::CONFIRMED));
    EXPECT_FALSE(PatternLifecycle::IsReviewable(PatternStatus::ACTIVE));
    EXPECT_FALSE(PatternLifecycle::IsReviewable(PatternStatus::REJECTED));
}

TEST(PatternLifecycleTest, ActiveFlagFollowsStatus) {
    RecurringChargePattern pattern = CreatePattern();
    EXPECT_EQ(PatternStatus::DETECTED, pattern.GetStatus());
    EXPECT_FALSE(pattern.IsActive());

    PatternLifecycle::Transition(pattern, PatternStatus::CONFIRMED, "alice", 1000);
    EXPECT_FALSE(pattern.IsActive());
    EXPECT_EQ("alice", *pattern.GetReviewedBy());
    EXPECT_EQ(1000, *pattern.GetReviewedAt());

    PatternLifecycle::Transition(pattern, PatternStatus::ACTIVE, "bob", 2000);
    EXPECT_TRUE(pattern.IsActive());
    EXPECT_TRUE(pattern.IsEligibleForCategorization());
    EXPECT_EQ("bob", *pattern.GetReviewedBy());
    EXPECT_EQ(2000, pattern.GetUpdatedAt());

    PatternLifecycle::Transition(pattern, PatternStatus::PAUSED, "bob", 3000);
    EXPECT_FALSE(pattern.IsActive());
    EXPECT_FALSE(pattern.IsEligibleForCategorization());
}

TEST(PatternLifecycleTest, InvalidTransitionLeavesPatternUntouched) {
    RecurringChargePattern pattern = CreatePattern();

    try {
        PatternLifecycle::Transition(pattern, PatternStatus::ACTIVE, "alice", 1000);
        FAIL() << "Expected InvalidTransition";
    } catch (const InvalidTransition& e) {
        EXPECT_EQ(PatternStatus::DETECTED, e.from());
        EXPECT_EQ(PatternStatus::ACTIVE, e.to());
    }

    EXPECT_EQ(PatternStatus::DETECTED, pattern.GetStatus());
    EXPECT_FALSE(pattern.GetReviewedBy().has_value());
}

TEST(PatternLifecycleTest, RejectedPatternCannotMove) {
    RecurringChargePattern pattern = CreatePattern();
    PatternLifecycle::Transition(pattern, PatternStatus::REJECTED, "alice", 1000);

    for (PatternStatus to : {PatternStatus::DETECTED, PatternStatus::CONFIRMED,
                             PatternStatus::ACTIVE, PatternStatus::PAUSED}) {
        EXPECT_THROW(PatternLifecycle::Transition(pattern, to, "alice", 2000),
                     InvalidTransition);
    }
}

} // namespace
} // namespace recur
