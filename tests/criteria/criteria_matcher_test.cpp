// File: tests/criteria/criteria_matcher_test.cpp
#include "criteria/criteria_matcher.hpp"
#include "criteria/criteria_builders.hpp"
#include "review/pattern_lifecycle.hpp"
#include "../common/transaction_fixtures.hpp"
#include <gtest/gtest.h>
#include <regex>

namespace recur {
namespace {

using testing::Day;
using testing::MakeTransaction;

MerchantCriteria Merchant(const std::string& pattern, MatchType type,
                          std::vector<std::string> exclusions = {}) {
    MerchantCriteria criteria;
    criteria.pattern = pattern;
    criteria.match_type = type;
    criteria.exclusions = std::move(exclusions);
    return criteria;
}

RecurringChargePattern NetflixPattern() {
    RecurringChargePattern pattern(PatternID::Generate(), "user-1", {"a", "b", "c"});
    pattern.SetMerchantCriteria(Merchant("NETFLIX", MatchType::CONTAINS));

    AmountCriteria amount;
    amount.mean = 15.49;
    amount.tolerance_pct = 5.0;
    pattern.SetAmountCriteria(amount);

    TemporalCriteria temporal;
    temporal.frequency = RecurrenceFrequency::MONTHLY;
    temporal.pattern_type = TemporalPatternType::DAY_OF_MONTH;
    temporal.day_of_month = 15;
    temporal.tolerance_days = 2;
    pattern.SetTemporalCriteria(temporal);
    return pattern;
}

// ============================================================================
// Merchant Matching
// ============================================================================

TEST(CriteriaMatcherTest, MerchantMatchTypes) {
    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(Merchant("NETFLIX", MatchType::CONTAINS),
                                                 "pos netflix.com 1234"));
    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(Merchant("netflix", MatchType::PREFIX),
                                                 "NETFLIX.COM"));
    EXPECT_FALSE(CriteriaMatcher::MatchesMerchant(Merchant("NETFLIX", MatchType::PREFIX),
                                                  "POS NETFLIX"));
    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(Merchant(".COM", MatchType::SUFFIX),
                                                 "NETFLIX.COM"));
    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(Merchant("HULU", MatchType::EXACT), "hulu"));
    EXPECT_FALSE(CriteriaMatcher::MatchesMerchant(Merchant("HULU", MatchType::EXACT),
                                                  "HULU LLC"));
}

TEST(CriteriaMatcherTest, CaseSensitiveMerchant) {
    MerchantCriteria criteria = Merchant("Netflix", MatchType::CONTAINS);
    criteria.case_sensitive = true;
    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(criteria, "Netflix Inc"));
    EXPECT_FALSE(CriteriaMatcher::MatchesMerchant(criteria, "NETFLIX INC"));
}

TEST(CriteriaMatcherTest, ExclusionsWin) {
    MerchantCriteria criteria = Merchant("AMAZON", MatchType::CONTAINS, {"refund"});
    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(criteria, "AMAZON PRIME"));
    EXPECT_FALSE(CriteriaMatcher::MatchesMerchant(criteria, "AMAZON PRIME REFUND"));
}

TEST(CriteriaMatcherTest, RegexMatching) {
    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(Merchant("^spot(ify)?\\s", MatchType::REGEX),
                                                 "SPOTIFY USA"));
    EXPECT_FALSE(CriteriaMatcher::MatchesMerchant(Merchant("^hulu$", MatchType::REGEX),
                                                  "HULU LLC"));
    // An invalid expression never matches
    EXPECT_FALSE(CriteriaMatcher::MatchesMerchant(Merchant("[unclosed", MatchType::REGEX),
                                                  "[unclosed"));
}

TEST(CriteriaMatcherTest, RegexCompiledOncePerCaseMode) {
    MerchantCriteria folded = Merchant("^netflix", MatchType::REGEX);
    MerchantCriteria exact = folded;
    exact.case_sensitive = true;

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(folded, "NETFLIX.COM"));
        EXPECT_FALSE(CriteriaMatcher::MatchesMerchant(exact, "NETFLIX.COM"));
        EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(exact, "netflix.com"));
        EXPECT_FALSE(CriteriaMatcher::MatchesMerchant(Merchant("(bad", MatchType::REGEX),
                                                      "(bad"));
    }
}

TEST(CriteriaMatcherTest, ExportedRegexMatchesAsRegexCriterion) {
    MerchantCriteria prefix = Merchant("NETFLIX.COM", MatchType::PREFIX, {"REFUND"});
    MerchantCriteria exported = Merchant(CriteriaMatcher::ToRegex(prefix), MatchType::REGEX);
    exported.case_sensitive = true;

    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(exported, "netflix.com 8665797172"));
    EXPECT_FALSE(CriteriaMatcher::MatchesMerchant(exported, "NETFLIX.COM REFUND"));
    EXPECT_FALSE(CriteriaMatcher::MatchesMerchant(exported, "HULU NETFLIX.COM"));
}

TEST(CriteriaMatcherTest, LiteralMatchIgnoresSurroundingWhitespace) {
    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(Merchant("NETFLIX.COM", MatchType::PREFIX),
                                                 "  NETFLIX.COM 111"));
    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(Merchant("HULU", MatchType::EXACT),
                                                 " hulu \t"));
    EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(Merchant(".COM", MatchType::SUFFIX),
                                                 "NETFLIX.COM  "));
}

TEST(CriteriaMatcherTest, BuiltMerchantRuleMatchesEveryMember) {
    std::vector<std::string> descriptions = {"  NETFLIX.COM 111", "NETFLIX.COM 222",
                                             "NETFLIX.COM 333"};
    MerchantAnalysis analysis = MerchantCriteriaBuilder::Analyze(descriptions);
    ASSERT_EQ(MatchType::PREFIX, analysis.match_type);
    ASSERT_EQ("NETFLIX.COM", analysis.suggested_pattern);

    MerchantCriteria criteria = analysis.ToCriteria();
    for (const auto& description : descriptions) {
        EXPECT_TRUE(CriteriaMatcher::MatchesMerchant(criteria, description)) << description;
    }
}

// ============================================================================
// Amount and Temporal Matching
// ============================================================================

TEST(CriteriaMatcherTest, AmountUsesMagnitudeAndTolerance) {
    AmountCriteria criteria;
    criteria.mean = 15.49;
    criteria.tolerance_pct = 5.0;

    EXPECT_TRUE(CriteriaMatcher::MatchesAmount(criteria, -15.49));
    EXPECT_TRUE(CriteriaMatcher::MatchesAmount(criteria, 16.0));
    EXPECT_FALSE(CriteriaMatcher::MatchesAmount(criteria, -17.0));
    EXPECT_FALSE(CriteriaMatcher::MatchesAmount(criteria, 14.5));
}

TEST(CriteriaMatcherTest, DayOfMonthTolerance) {
    CriteriaMatcher matcher(CreateHolidayCalendar("US"));
    TemporalCriteria criteria;
    criteria.pattern_type = TemporalPatternType::DAY_OF_MONTH;
    criteria.day_of_month = 15;
    criteria.tolerance_days = 2;

    EXPECT_TRUE(matcher.MatchesTemporal(criteria, Day(2024, 3, 17)));
    EXPECT_TRUE(matcher.MatchesTemporal(criteria, Day(2024, 3, 13)));
    EXPECT_FALSE(matcher.MatchesTemporal(criteria, Day(2024, 3, 18)));
}

TEST(CriteriaMatcherTest, DayOfWeekWrapsAroundTheWeek) {
    CriteriaMatcher matcher(CreateHolidayCalendar("US"));
    TemporalCriteria criteria;
    criteria.pattern_type = TemporalPatternType::DAY_OF_WEEK;
    criteria.day_of_week = 0;
    criteria.tolerance_days = 0;

    EXPECT_TRUE(matcher.MatchesTemporal(criteria, Day(2024, 1, 8)));    // Monday
    EXPECT_FALSE(matcher.MatchesTemporal(criteria, Day(2024, 1, 7)));   // Sunday

    criteria.tolerance_days = 1;
    EXPECT_TRUE(matcher.MatchesTemporal(criteria, Day(2024, 1, 7)));
}

TEST(CriteriaMatcherTest, WorkingDayShapes) {
    CriteriaMatcher matcher(CreateHolidayCalendar("US"));
    TemporalCriteria criteria;
    criteria.pattern_type = TemporalPatternType::LAST_WORKING_DAY;
    criteria.tolerance_days = 0;

    EXPECT_TRUE(matcher.MatchesTemporal(criteria, Day(2024, 11, 29)));
    EXPECT_FALSE(matcher.MatchesTemporal(criteria, Day(2024, 11, 27)));

    criteria.pattern_type = TemporalPatternType::FIRST_WORKING_DAY;
    EXPECT_TRUE(matcher.MatchesTemporal(criteria, Day(2024, 9, 3)));
    EXPECT_FALSE(matcher.MatchesTemporal(criteria, Day(2024, 9, 2)));
}

TEST(CriteriaMatcherTest, WeekdayOfMonthRequiresWeekday) {
    CriteriaMatcher matcher(CreateHolidayCalendar("US"));
    TemporalCriteria criteria;
    criteria.pattern_type = TemporalPatternType::FIRST_WEEKDAY_OF_MONTH;
    criteria.day_of_week = 2;

    EXPECT_TRUE(matcher.MatchesTemporal(criteria, Day(2024, 5, 1)));    // first Wednesday
    EXPECT_FALSE(matcher.MatchesTemporal(criteria, Day(2024, 5, 2)));   // first Thursday
    EXPECT_FALSE(matcher.MatchesTemporal(criteria, Day(2024, 5, 8)));   // second Wednesday
}

TEST(CriteriaMatcherTest, WeekendAndFlexible) {
    CriteriaMatcher matcher(CreateHolidayCalendar("US"));
    TemporalCriteria criteria;
    criteria.pattern_type = TemporalPatternType::WEEKEND;
    EXPECT_TRUE(matcher.MatchesTemporal(criteria, Day(2024, 1, 6)));
    EXPECT_FALSE(matcher.MatchesTemporal(criteria, Day(2024, 1, 5)));

    criteria.pattern_type = TemporalPatternType::FLEXIBLE;
    EXPECT_TRUE(matcher.MatchesTemporal(criteria, Day(2024, 1, 5)));
}

// ============================================================================
// Whole Pattern
// ============================================================================

TEST(CriteriaMatcherTest, AllThreeCriteriaMustHold) {
    CriteriaMatcher matcher(CreateHolidayCalendar("US"));
    RecurringChargePattern pattern = NetflixPattern();

    EXPECT_TRUE(matcher.Matches(pattern, MakeTransaction("t", Day(2024, 4, 15), "NETFLIX", -15.49)));
    EXPECT_FALSE(matcher.Matches(pattern, MakeTransaction("t", Day(2024, 4, 15), "HULU", -15.49)));
    EXPECT_FALSE(matcher.Matches(pattern, MakeTransaction("t", Day(2024, 4, 15), "NETFLIX", -22.99)));
    EXPECT_FALSE(matcher.Matches(pattern, MakeTransaction("t", Day(2024, 4, 25), "NETFLIX", -15.49)));
}

TEST(CriteriaMatcherTest, OnlyActivePatternsAreEligible) {
    CriteriaMatcher matcher(CreateHolidayCalendar("US"));
    std::vector<RecurringChargePattern> patterns = {NetflixPattern(), NetflixPattern(),
                                                    NetflixPattern()};

    PatternLifecycle::Transition(patterns[1], PatternStatus::CONFIRMED, "alice", 1);
    PatternLifecycle::Transition(patterns[2], PatternStatus::CONFIRMED, "alice", 1);
    PatternLifecycle::Transition(patterns[2], PatternStatus::ACTIVE, "alice", 2);

    Transaction tx = MakeTransaction("t", Day(2024, 4, 15), "NETFLIX.COM", -15.49);
    auto matches = matcher.FindEligibleMatches(tx, patterns);

    ASSERT_EQ(1u, matches.size());
    EXPECT_EQ(&patterns[2], matches[0]);

    PatternLifecycle::Transition(patterns[2], PatternStatus::PAUSED, "alice", 3);
    EXPECT_TRUE(matcher.FindEligibleMatches(tx, patterns).empty());
}

// ============================================================================
// Regex Export
// ============================================================================

TEST(CriteriaMatcherTest, ToRegexPerMatchType) {
    EXPECT_EQ("(?i)NETFLIX\\.COM", CriteriaMatcher::ToRegex(Merchant("NETFLIX.COM",
                                                                      MatchType::CONTAINS)));
    EXPECT_EQ("(?i)^HULU$", CriteriaMatcher::ToRegex(Merchant("HULU", MatchType::EXACT)));
    EXPECT_EQ("(?i)^NETFLIX", CriteriaMatcher::ToRegex(Merchant("NETFLIX", MatchType::PREFIX)));
    EXPECT_EQ("(?i)\\.COM$", CriteriaMatcher::ToRegex(Merchant(".COM", MatchType::SUFFIX)));
    EXPECT_EQ("(?i)sp[aeiou]t", CriteriaMatcher::ToRegex(Merchant("sp[aeiou]t", MatchType::REGEX)));
}

TEST(CriteriaMatcherTest, ToRegexWithExclusions) {
    MerchantCriteria criteria = Merchant("AMAZON", MatchType::PREFIX, {"REFUND", "A+B"});
    criteria.case_sensitive = true;
    EXPECT_EQ("^(?!.*(REFUND|A\\+B))AMAZON", CriteriaMatcher::ToRegex(criteria));

    MerchantCriteria contains = Merchant("PRIME", MatchType::CONTAINS, {"REFUND"});
    contains.case_sensitive = true;
    EXPECT_EQ("^(?!.*(REFUND)).*PRIME", CriteriaMatcher::ToRegex(contains));
}

TEST(CriteriaMatcherTest, ExportedRegexWithoutFlagsCompiles) {
    MerchantCriteria criteria = Merchant("AMAZON", MatchType::CONTAINS, {"REFUND"});
    criteria.case_sensitive = true;
    std::regex compiled(CriteriaMatcher::ToRegex(criteria));

    EXPECT_TRUE(std::regex_search("POS AMAZON PRIME", compiled));
    EXPECT_FALSE(std::regex_search("AMAZON PRIME REFUND", compiled));
}

TEST(CriteriaMatcherTest, EscapeRegex) {
    EXPECT_EQ("a\\.b\\*c\\(d\\)", CriteriaMatcher::EscapeRegex("a.b*c(d)"));
    EXPECT_EQ("plain", CriteriaMatcher::EscapeRegex("plain"));
}

} // namespace
} // namespace recur
