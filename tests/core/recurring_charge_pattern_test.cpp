// File: tests/core/recurring_charge_pattern_test.cpp
#include "core/recurring_charge_pattern.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

namespace recur {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

RecurringChargePattern CreateTestPattern() {
    RecurringChargePattern pattern(PatternID::Generate(), "user-1", {"tx-1", "tx-2", "tx-3"});

    MerchantCriteria merchant;
    merchant.pattern = "NETFLIX";
    merchant.match_type = MatchType::PREFIX;
    merchant.exclusions = {"REFUND"};
    pattern.SetMerchantCriteria(merchant);

    AmountCriteria amount;
    amount.mean = 15.49;
    amount.std_dev = 0.0;
    amount.min = 15.49;
    amount.max = 15.49;
    amount.tolerance_pct = 5.0;
    pattern.SetAmountCriteria(amount);

    TemporalCriteria temporal;
    temporal.frequency = RecurrenceFrequency::MONTHLY;
    temporal.pattern_type = TemporalPatternType::DAY_OF_MONTH;
    temporal.day_of_month = 15;
    temporal.tolerance_days = 2;
    pattern.SetTemporalCriteria(temporal);

    pattern.SetConfidence(0.92);
    pattern.SetTransactionCount(3);
    pattern.SetOccurrenceRange(1705276800000LL, 1710460800000LL);
    pattern.SetFeatureVector(FeatureVector(kBaseFeatureWidth), FeatureMode::BASE);
    pattern.SetClusterID(4);
    pattern.SetSuggestedCategoryID(std::string("cat-streaming"));
    pattern.SetCreatedAt(1000);
    pattern.Touch(2000);
    pattern.SetVersion(7);
    return pattern;
}

// ============================================================================
// Construction Tests
// ============================================================================

TEST(RecurringChargePatternTest, NewPatternIsDetectedAndInactive) {
    RecurringChargePattern pattern(PatternID::Generate(), "user-1", {"a", "b", "c"});

    EXPECT_EQ(PatternStatus::DETECTED, pattern.GetStatus());
    EXPECT_FALSE(pattern.IsActive());
    EXPECT_FALSE(pattern.IsCriteriaValidated());
    EXPECT_FALSE(pattern.IsEligibleForCategorization());
    EXPECT_FALSE(pattern.GetReviewedBy().has_value());
    EXPECT_EQ(0u, pattern.GetVersion());
}

TEST(RecurringChargePatternTest, MatchedTransactionIDsAreKeptInOrder) {
    RecurringChargePattern pattern(PatternID::Generate(), "user-1", {"c", "a", "b"});

    const auto& ids = pattern.GetMatchedTransactionIDs();
    ASSERT_EQ(3u, ids.size());
    EXPECT_EQ("c", ids[0]);
    EXPECT_EQ("a", ids[1]);
    EXPECT_EQ("b", ids[2]);
}

TEST(RecurringChargePatternTest, CopiesDoNotShareMatchedIDs) {
    RecurringChargePattern original(PatternID::Generate(), "user-1", {"a", "b", "c"});
    RecurringChargePattern copy = original;

    copy.SetConfidence(0.5);
    EXPECT_EQ(original.GetMatchedTransactionIDs(), copy.GetMatchedTransactionIDs());
    EXPECT_EQ(0.0, original.GetConfidence());
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST(RecurringChargePatternTest, ConfidenceMustBeWithinUnitInterval) {
    RecurringChargePattern pattern;
    EXPECT_NO_THROW(pattern.SetConfidence(0.0));
    EXPECT_NO_THROW(pattern.SetConfidence(1.0));
    EXPECT_THROW(pattern.SetConfidence(-0.01), std::invalid_argument);
    EXPECT_THROW(pattern.SetConfidence(1.01), std::invalid_argument);
}

TEST(RecurringChargePatternTest, OccurrenceRangeMustBeOrdered) {
    RecurringChargePattern pattern;
    EXPECT_THROW(pattern.SetOccurrenceRange(200, 100), std::invalid_argument);
    pattern.SetOccurrenceRange(100, 100);
    EXPECT_EQ(100, pattern.GetFirstOccurrence());
    EXPECT_EQ(100, pattern.GetLastOccurrence());
}

TEST(RecurringChargePatternTest, FeatureVectorWidthMustMatchMode) {
    RecurringChargePattern pattern;
    EXPECT_THROW(pattern.SetFeatureVector(FeatureVector(kBaseFeatureWidth),
                                          FeatureMode::ACCOUNT_AWARE),
                 std::invalid_argument);
    EXPECT_NO_THROW(pattern.SetFeatureVector(FeatureVector(kAccountAwareFeatureWidth),
                                             FeatureMode::ACCOUNT_AWARE));
    EXPECT_EQ(FeatureMode::ACCOUNT_AWARE, pattern.GetFeatureMode());
}

TEST(RecurringChargePatternTest, FeatureVectorWidthErrorNamesMode) {
    RecurringChargePattern pattern;
    try {
        pattern.SetFeatureVector(FeatureVector(3), FeatureMode::BASE);
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        std::string message = e.what();
        EXPECT_NE(std::string::npos, message.find("mode BASE"));
        EXPECT_NE(std::string::npos, message.find("requires 67"));
    }
}

TEST(RecurringChargePatternTest, RecordReviewStampsReviewerAndTime) {
    RecurringChargePattern pattern = CreateTestPattern();
    pattern.RecordReview("alice", 5000);

    ASSERT_TRUE(pattern.GetReviewedBy().has_value());
    EXPECT_EQ("alice", *pattern.GetReviewedBy());
    EXPECT_EQ(5000, *pattern.GetReviewedAt());
    EXPECT_EQ(5000, pattern.GetUpdatedAt());
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST(RecurringChargePatternTest, SerializationRoundTrip) {
    RecurringChargePattern original = CreateTestPattern();
    original.SetCriteriaValidation(false, {"2 original transactions do not match"});

    std::stringstream ss;
    original.Serialize(ss);
    RecurringChargePattern restored = RecurringChargePattern::Deserialize(ss);

    EXPECT_EQ(original, restored);
    EXPECT_EQ(7u, restored.GetVersion());
    ASSERT_TRUE(restored.GetTemporalCriteria().day_of_month.has_value());
    EXPECT_EQ(15, *restored.GetTemporalCriteria().day_of_month);
    EXPECT_FALSE(restored.GetTemporalCriteria().day_of_week.has_value());
}

TEST(RecurringChargePatternTest, DeserializeRejectsGarbage) {
    std::stringstream ss;
    ss.put(static_cast<char>(0x7F));
    EXPECT_THROW(RecurringChargePattern::Deserialize(ss), std::runtime_error);
}

// Writes the record header followed by a user id length prefix
std::string RecordWithUserIdLength(uint32_t user_id_length) {
    std::ostringstream out;
    out.put(static_cast<char>(1));
    PatternID("pattern-1").Serialize(out);
    out.write(reinterpret_cast<const char*>(&user_id_length), sizeof(user_id_length));
    out.write("user", 4);
    return out.str();
}

TEST(RecurringChargePatternTest, DeserializeRejectsOversizedStringLength) {
    std::istringstream in(RecordWithUserIdLength(0xFFFFFFF0u));
    EXPECT_THROW(RecurringChargePattern::Deserialize(in), std::runtime_error);
}

TEST(RecurringChargePatternTest, DeserializeRejectsOversizedListCount) {
    std::ostringstream out;
    out.put(static_cast<char>(1));
    PatternID("pattern-1").Serialize(out);
    uint32_t user_length = 4;
    out.write(reinterpret_cast<const char*>(&user_length), sizeof(user_length));
    out.write("user", 4);
    uint32_t count = 0x7FFFFFFFu;
    out.write(reinterpret_cast<const char*>(&count), sizeof(count));

    std::istringstream in(out.str());
    EXPECT_THROW(RecurringChargePattern::Deserialize(in), std::runtime_error);
}

TEST(RecurringChargePatternTest, DeserializeRejectsOversizedIdLength) {
    std::ostringstream out;
    out.put(static_cast<char>(1));
    uint32_t id_length = 0xFFFFFFFFu;
    out.write(reinterpret_cast<const char*>(&id_length), sizeof(id_length));

    std::istringstream in(out.str());
    EXPECT_THROW(RecurringChargePattern::Deserialize(in), std::runtime_error);
}

TEST(RecurringChargePatternTest, ToStringMentionsMerchantAndStatus) {
    RecurringChargePattern pattern = CreateTestPattern();
    std::string text = pattern.ToString();

    EXPECT_NE(std::string::npos, text.find("NETFLIX"));
    EXPECT_NE(std::string::npos, text.find("MONTHLY"));
    EXPECT_NE(std::string::npos, text.find("DETECTED"));
}

} // namespace
} // namespace recur
