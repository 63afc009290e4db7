// File: tests/integration/integration_test.cpp
//
// End-to-end tests: detection, persistence, review, validation and prediction
// working together over one user's history.

#include "detection/detection_service.hpp"
#include "detection/prediction_service.hpp"
#include "review/pattern_review_service.hpp"
#include "storage/sqlite_pattern_repository.hpp"
#include "validation/pattern_validation_service.hpp"
#include "../common/transaction_fixtures.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

namespace recur {
namespace {

using testing::Day;
using testing::MakeTransaction;
using testing::MonthlySeries;

// ============================================================================
// Test Fixture
// ============================================================================

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        holidays_ = CreateHolidayCalendar("US");

        transactions_ = MonthlySeries("nflx", "NETFLIX.COM", -15.19, 2024, 1, 12, 15);
        transactions_.back().amount = -15.49;
        transactions_.push_back(
            MakeTransaction("bby-1", Day(2024, 7, 3), "BEST BUY ELECTRONICS", -899.99));

        SqlitePatternRepository::Config repo_config;
        repo_config.db_path = ":memory:";
        repository_ = std::make_shared<SqlitePatternRepository>(repo_config);
        validator_ = std::make_shared<PatternValidationService>(holidays_);
        review_ = std::make_unique<PatternReviewService>(repository_, validator_);

        DetectionService::Config config;
        config.eps = 2.5;
        DetectionService detection(config, holidays_);
        DetectionResult result = detection.Detect("user-1", transactions_);
        ASSERT_EQ(1u, result.patterns.size());

        detected_ = result.patterns[0];
        ASSERT_TRUE(repository_->Store(detected_));
    }

    std::shared_ptr<const HolidayCalendar> holidays_;
    std::vector<Transaction> transactions_;
    std::shared_ptr<SqlitePatternRepository> repository_;
    std::shared_ptr<PatternValidationService> validator_;
    std::unique_ptr<PatternReviewService> review_;
    RecurringChargePattern detected_;
};

// ============================================================================
// Workflows
// ============================================================================

TEST_F(IntegrationTest, DetectedCriteriaReproduceCluster) {
    PatternCriteriaValidation validation = validator_->Validate(detected_, transactions_);

    EXPECT_TRUE(validation.is_valid);
    EXPECT_TRUE(validation.perfect_match);
    EXPECT_EQ(12u, validation.criteria_match_count);
}

TEST_F(IntegrationTest, RejectedPatternCannotBeActivated) {
    ReviewResult result =
        review_->Review(detected_, ReviewAction::Reject("alice"), transactions_);

    EXPECT_EQ(PatternStatus::REJECTED, result.pattern.GetStatus());
    EXPECT_FALSE(result.pattern.IsActive());
    ASSERT_TRUE(result.pattern.GetReviewedBy().has_value());
    EXPECT_EQ("alice", *result.pattern.GetReviewedBy());
    EXPECT_TRUE(result.pattern.GetReviewedAt().has_value());

    EXPECT_THROW(review_->Activate(result.pattern, "alice"), InvalidTransition);

    auto stored = repository_->Retrieve(detected_.GetID());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(PatternStatus::REJECTED, stored->GetStatus());
}

TEST_F(IntegrationTest, TightenedToleranceMissesOneOriginal) {
    CriteriaEdits edits;
    edits.amount_tolerance_pct = 1.0;
    ReviewResult edited =
        review_->Review(detected_, ReviewAction::Edit("alice", edits), transactions_);

    PatternCriteriaValidation validation = validator_->Validate(edited.pattern, transactions_);
    EXPECT_FALSE(validation.perfect_match);
    ASSERT_EQ(1u, validation.missing_from_criteria.size());
    EXPECT_EQ("nflx-12", validation.missing_from_criteria[0]);
    EXPECT_TRUE(validation.no_false_positives);
}

TEST_F(IntegrationTest, ConcurrentReviewsCommitOnce) {
    std::atomic<int> committed{0};
    std::atomic<int> conflicts{0};

    auto review = [&](const ReviewAction& action) {
        try {
            review_->Review(detected_, action, transactions_);
            committed.fetch_add(1);
        } catch (const TransitionConflict&) {
            conflicts.fetch_add(1);
        }
    };

    std::thread first(review, ReviewAction::Confirm("alice", true));
    std::thread second(review, ReviewAction::Reject("bob"));
    first.join();
    second.join();

    EXPECT_EQ(1, committed.load());
    EXPECT_EQ(1, conflicts.load());

    auto stored = repository_->Retrieve(detected_.GetID());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(1u, stored->GetVersion());
    EXPECT_TRUE(stored->GetStatus() == PatternStatus::ACTIVE ||
                stored->GetStatus() == PatternStatus::REJECTED);
}

TEST_F(IntegrationTest, ActivePatternPredictsNextCharge) {
    ReviewResult confirmed =
        review_->Review(detected_, ReviewAction::Confirm("alice", true), transactions_);
    ASSERT_EQ(PatternStatus::ACTIVE, confirmed.pattern.GetStatus());

    auto active = repository_->FindActive("user-1");
    ASSERT_EQ(1u, active.size());

    PredictionService predictions(holidays_);
    Prediction next = predictions.PredictNext(active[0], Day(2024, 12, 20));
    EXPECT_EQ(Day(2025, 1, 15), next.next_expected_date);
    EXPECT_NEAR(15.215, next.expected_amount, 1e-9);
    EXPECT_NEAR(0.99, next.confidence, 1e-9);
}

} // namespace
} // namespace recur
