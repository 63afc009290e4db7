// File: tests/review/pattern_review_service_test.cpp
#include "review/pattern_review_service.hpp"
#include "storage/memory_pattern_repository.hpp"
#include "../common/transaction_fixtures.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <thread>

namespace recur {
namespace {

using testing::Day;
using testing::MonthlySeries;

constexpr EpochMillis kNow = 5000;

class PatternReviewServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<MemoryPatternRepository>();
        validator_ = std::make_shared<PatternValidationService>(CreateHolidayCalendar("US"));
        service_ = std::make_unique<PatternReviewService>(repository_, validator_,
                                                          []() { return kNow; });

        transactions_ = MonthlySeries("nflx", "NETFLIX.COM", -15.19, 2024, 1, 12, 15);
        transactions_.back().amount = -15.49;
    }

    /// Store a detected Netflix pattern with the given amount tolerance
    RecurringChargePattern StorePattern(double tolerance_pct) {
        std::vector<std::string> ids;
        for (int i = 1; i <= 12; ++i) {
            ids.push_back("nflx-" + std::to_string(i));
        }
        RecurringChargePattern pattern(PatternID::Generate(), "user-1", ids);

        MerchantCriteria merchant;
        merchant.pattern = "NETFLIX";
        merchant.match_type = MatchType::PREFIX;
        pattern.SetMerchantCriteria(merchant);

        AmountCriteria amount;
        amount.mean = 15.215;
        amount.tolerance_pct = tolerance_pct;
        pattern.SetAmountCriteria(amount);

        TemporalCriteria temporal;
        temporal.frequency = RecurrenceFrequency::MONTHLY;
        temporal.pattern_type = TemporalPatternType::DAY_OF_MONTH;
        temporal.day_of_month = 15;
        temporal.tolerance_days = 2;
        pattern.SetTemporalCriteria(temporal);

        pattern.SetOccurrenceRange(Day(2024, 1, 15), Day(2024, 12, 15));
        EXPECT_TRUE(repository_->Store(pattern));
        return pattern;
    }

    std::shared_ptr<MemoryPatternRepository> repository_;
    std::shared_ptr<PatternValidationService> validator_;
    std::unique_ptr<PatternReviewService> service_;
    std::vector<Transaction> transactions_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(PatternReviewServiceTest, RequiresCollaborators) {
    EXPECT_THROW({ PatternReviewService service(nullptr, validator_); }, std::invalid_argument);
    EXPECT_THROW({ PatternReviewService service(repository_, nullptr); }, std::invalid_argument);
}

// ============================================================================
// Review Actions
// ============================================================================

TEST_F(PatternReviewServiceTest, ConfirmWithMatchingCriteria) {
    RecurringChargePattern pattern = StorePattern(5.0);

    ReviewResult result =
        service_->Review(pattern, ReviewAction::Confirm("alice"), transactions_);

    EXPECT_EQ(PatternStatus::CONFIRMED, result.pattern.GetStatus());
    EXPECT_FALSE(result.pattern.IsActive());
    EXPECT_TRUE(result.pattern.IsCriteriaValidated());
    EXPECT_TRUE(result.pattern.GetCriteriaValidationErrors().empty());
    EXPECT_EQ("alice", *result.pattern.GetReviewedBy());
    EXPECT_EQ(kNow, *result.pattern.GetReviewedAt());
    EXPECT_EQ(1u, result.pattern.GetVersion());
    ASSERT_TRUE(result.validation.has_value());
    EXPECT_TRUE(result.validation->perfect_match);

    auto stored = repository_->Retrieve(pattern.GetID());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(result.pattern, *stored);
}

TEST_F(PatternReviewServiceTest, ConfirmAndActivateImmediately) {
    RecurringChargePattern pattern = StorePattern(5.0);

    ReviewResult result =
        service_->Review(pattern, ReviewAction::Confirm("alice", true), transactions_);

    EXPECT_EQ(PatternStatus::ACTIVE, result.pattern.GetStatus());
    EXPECT_TRUE(result.pattern.IsActive());
    ASSERT_EQ(1u, repository_->FindActive("user-1").size());
}

TEST_F(PatternReviewServiceTest, ConfirmWithFailingCriteriaStaysDetected) {
    RecurringChargePattern pattern = StorePattern(1.0);

    ReviewResult result =
        service_->Review(pattern, ReviewAction::Confirm("alice", true), transactions_);

    EXPECT_EQ(PatternStatus::DETECTED, result.pattern.GetStatus());
    EXPECT_FALSE(result.pattern.IsActive());
    EXPECT_FALSE(result.pattern.IsCriteriaValidated());
    ASSERT_EQ(1u, result.pattern.GetCriteriaValidationErrors().size());
    EXPECT_EQ("1 original transactions don't match criteria",
              result.pattern.GetCriteriaValidationErrors()[0]);
    ASSERT_TRUE(result.validation.has_value());
    ASSERT_EQ(1u, result.validation->missing_from_criteria.size());
    EXPECT_EQ("nflx-12", result.validation->missing_from_criteria[0]);

    // The review is still recorded
    EXPECT_EQ(1u, result.pattern.GetVersion());
    EXPECT_EQ("alice", *result.pattern.GetReviewedBy());
}

TEST_F(PatternReviewServiceTest, Reject) {
    RecurringChargePattern pattern = StorePattern(5.0);

    ReviewResult result = service_->Review(
        pattern, ReviewAction::Reject("bob", std::string("not a subscription")), transactions_);

    EXPECT_EQ(PatternStatus::REJECTED, result.pattern.GetStatus());
    EXPECT_FALSE(result.pattern.IsActive());
    EXPECT_FALSE(result.validation.has_value());
    EXPECT_EQ("bob", *result.pattern.GetReviewedBy());
}

TEST_F(PatternReviewServiceTest, EditRevalidatesAndKeepsStatus) {
    RecurringChargePattern pattern = StorePattern(5.0);

    CriteriaEdits edits;
    edits.amount_tolerance_pct = 1.0;
    edits.suggested_category_id = std::string("streaming");

    ReviewResult result =
        service_->Review(pattern, ReviewAction::Edit("carol", edits), transactions_);

    EXPECT_EQ(PatternStatus::DETECTED, result.pattern.GetStatus());
    EXPECT_DOUBLE_EQ(1.0, result.pattern.GetAmountCriteria().tolerance_pct);
    EXPECT_EQ("streaming", *result.pattern.GetSuggestedCategoryID());
    EXPECT_FALSE(result.pattern.IsCriteriaValidated());
    ASSERT_TRUE(result.validation.has_value());
    EXPECT_EQ(1u, result.validation->missing_from_criteria.size());
}

TEST_F(PatternReviewServiceTest, EditRejectsNegativeTolerance) {
    RecurringChargePattern pattern = StorePattern(5.0);

    CriteriaEdits edits;
    edits.amount_tolerance_pct = -1.0;
    EXPECT_THROW(service_->Review(pattern, ReviewAction::Edit("carol", edits), transactions_),
                 std::invalid_argument);

    EXPECT_EQ(0u, repository_->Retrieve(pattern.GetID())->GetVersion());
}

TEST_F(PatternReviewServiceTest, EditRejectsNonFiniteTolerance) {
    RecurringChargePattern pattern = StorePattern(5.0);

    CriteriaEdits edits;
    edits.amount_tolerance_pct = std::nan("");
    EXPECT_THROW(service_->Review(pattern, ReviewAction::Edit("carol", edits), transactions_),
                 std::invalid_argument);

    edits.amount_tolerance_pct = std::numeric_limits<double>::infinity();
    EXPECT_THROW(service_->Review(pattern, ReviewAction::Edit("carol", edits), transactions_),
                 std::invalid_argument);

    auto stored = repository_->Retrieve(pattern.GetID());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(0u, stored->GetVersion());
    EXPECT_DOUBLE_EQ(5.0, stored->GetAmountCriteria().tolerance_pct);
}

TEST_F(PatternReviewServiceTest, NonReviewableStatusThrows) {
    RecurringChargePattern pattern = StorePattern(5.0);
    ReviewResult rejected =
        service_->Review(pattern, ReviewAction::Reject("bob"), transactions_);

    EXPECT_THROW(service_->Review(rejected.pattern, ReviewAction::Confirm("alice"), transactions_),
                 InvalidTransition);
}

TEST_F(PatternReviewServiceTest, UnstoredPatternThrows) {
    RecurringChargePattern pattern = StorePattern(5.0);
    repository_->Delete(pattern.GetID());

    EXPECT_THROW(service_->Review(pattern, ReviewAction::Reject("bob"), transactions_),
                 std::invalid_argument);
}

// ============================================================================
// Lifecycle Operations
// ============================================================================

TEST_F(PatternReviewServiceTest, ActivatePauseResume) {
    RecurringChargePattern pattern = StorePattern(5.0);
    RecurringChargePattern confirmed =
        service_->Review(pattern, ReviewAction::Confirm("alice"), transactions_).pattern;

    RecurringChargePattern active = service_->Activate(confirmed, "alice");
    EXPECT_EQ(PatternStatus::ACTIVE, active.GetStatus());
    EXPECT_TRUE(active.IsActive());
    EXPECT_EQ(2u, active.GetVersion());

    RecurringChargePattern paused = service_->Pause(active, "alice");
    EXPECT_EQ(PatternStatus::PAUSED, paused.GetStatus());
    EXPECT_FALSE(paused.IsActive());
    EXPECT_TRUE(repository_->FindActive("user-1").empty());

    RecurringChargePattern resumed = service_->Resume(paused, "alice");
    EXPECT_EQ(PatternStatus::ACTIVE, resumed.GetStatus());
    EXPECT_EQ(4u, resumed.GetVersion());
    EXPECT_EQ(1u, repository_->FindActive("user-1").size());
}

TEST_F(PatternReviewServiceTest, ActivateRequiresValidatedCriteria) {
    RecurringChargePattern pattern = StorePattern(5.0);
    PatternLifecycle::Transition(pattern, PatternStatus::CONFIRMED, "alice", 1000);
    ASSERT_TRUE(repository_->Update(pattern));
    pattern.SetVersion(1);

    EXPECT_THROW(service_->Activate(pattern, "alice"), InvalidTransition);
}

TEST_F(PatternReviewServiceTest, InvalidLifecycleMovesThrow) {
    RecurringChargePattern pattern = StorePattern(5.0);

    EXPECT_THROW(service_->Activate(pattern, "alice"), InvalidTransition);
    EXPECT_THROW(service_->Pause(pattern, "alice"), InvalidTransition);
    EXPECT_THROW(service_->Resume(pattern, "alice"), InvalidTransition);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(PatternReviewServiceTest, StaleCopyConflicts) {
    RecurringChargePattern pattern = StorePattern(5.0);
    service_->Review(pattern, ReviewAction::Confirm("alice"), transactions_);

    try {
        service_->Review(pattern, ReviewAction::Reject("bob"), transactions_);
        FAIL() << "Expected TransitionConflict";
    } catch (const TransitionConflict& e) {
        EXPECT_EQ(pattern.GetID(), e.pattern_id());
        EXPECT_EQ(PatternStatus::DETECTED, e.expected_status());
        EXPECT_EQ(0u, e.expected_version());
    }

    EXPECT_EQ(PatternStatus::CONFIRMED, repository_->Retrieve(pattern.GetID())->GetStatus());
}

TEST_F(PatternReviewServiceTest, ConcurrentReviewsOfSameCopy) {
    RecurringChargePattern pattern = StorePattern(5.0);

    std::atomic<int> committed{0};
    std::atomic<int> conflicts{0};

    auto review = [&](const ReviewAction& action) {
        try {
            service_->Review(pattern, action, transactions_);
            committed.fetch_add(1);
        } catch (const TransitionConflict&) {
            conflicts.fetch_add(1);
        }
    };

    std::thread confirm_thread(review, ReviewAction::Confirm("alice"));
    std::thread reject_thread(review, ReviewAction::Reject("bob"));
    confirm_thread.join();
    reject_thread.join();

    EXPECT_EQ(1, committed.load());
    EXPECT_EQ(1, conflicts.load());
    EXPECT_EQ(1u, repository_->Retrieve(pattern.GetID())->GetVersion());
    EXPECT_EQ(1u, repository_->GetStats().conflicts);
}

} // namespace
} // namespace recur
