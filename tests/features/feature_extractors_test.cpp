// File: tests/features/feature_extractors_test.cpp
#include "features/account_features.hpp"
#include "features/amount_features.hpp"
#include "features/description_features.hpp"
#include "features/temporal_features.hpp"
#include "features/tfidf_vectorizer.hpp"
#include "../common/transaction_fixtures.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>

namespace recur {
namespace {

using testing::Day;
using testing::MakeAccount;
using testing::MakeTransaction;

// ============================================================================
// Capability Check
// ============================================================================

TEST(FeatureExtractorTest, ExtractorsSatisfyCapability) {
    EXPECT_TRUE(IsFeatureExtractor<TemporalFeatureExtractor>::value);
    EXPECT_TRUE(IsFeatureExtractor<AmountFeatureExtractor>::value);
    EXPECT_TRUE(IsFeatureExtractor<DescriptionFeatureExtractor>::value);
    EXPECT_TRUE(IsFeatureExtractor<AccountFeatureExtractor>::value);
    EXPECT_FALSE(IsFeatureExtractor<TfidfVectorizer>::value);
}

struct BrokenExtractor {
    size_t FeatureSize() const { return 2; }
    FeatureBlock ExtractBatch(const std::vector<Transaction>& transactions) {
        return FeatureBlock(transactions.size(), FeatureVector(3));
    }
};

TEST(FeatureExtractorTest, SlotRejectsWrongWidth) {
    auto slot = FeatureExtractorSlot::Wrap("broken", std::make_shared<BrokenExtractor>());
    std::vector<Transaction> txs = {MakeTransaction("t1", Day(2024, 1, 2), "X", -1.0)};
    EXPECT_THROW(slot.ExtractBatch(txs), std::logic_error);
}

TEST(FeatureExtractorTest, SlotRejectsNullExtractor) {
    std::shared_ptr<AmountFeatureExtractor> missing;
    EXPECT_THROW(FeatureExtractorSlot::Wrap("amount", missing), std::invalid_argument);
}

// ============================================================================
// Temporal Features
// ============================================================================

TEST(TemporalFeatureExtractorTest, NewYearsDayFlags) {
    TemporalFeatureExtractor extractor(CreateHolidayCalendar("US"));
    FeatureVector row = extractor.Extract(MakeTransaction("t1", Day(2024, 1, 1), "X", -1.0));

    ASSERT_EQ(17u, row.Dimension());
    EXPECT_NEAR(0.0f, row[0], 1e-6);    // Monday sin
    EXPECT_NEAR(1.0f, row[1], 1e-6);    // Monday cos
    EXPECT_EQ(0.0f, row[8]);            // holiday, not a working day
    EXPECT_EQ(0.0f, row[9]);
    EXPECT_EQ(1.0f, row[11]);           // first Monday of the month
    EXPECT_EQ(0.0f, row[13]);           // not weekend
    EXPECT_EQ(1.0f, row[14]);           // first calendar day
    EXPECT_EQ(0.0f, row[15]);
    EXPECT_FLOAT_EQ(0.0f, row[16]);
}

TEST(TemporalFeatureExtractorTest, LastDayOfMonthFlags) {
    TemporalFeatureExtractor extractor(CreateHolidayCalendar("US"));
    FeatureVector row = extractor.Extract(MakeTransaction("t1", Day(2024, 1, 31), "X", -1.0));

    EXPECT_EQ(1.0f, row[8]);    // working day
    EXPECT_EQ(1.0f, row[10]);   // last working day
    EXPECT_EQ(1.0f, row[12]);   // last Wednesday
    EXPECT_EQ(1.0f, row[15]);   // last calendar day
    EXPECT_FLOAT_EQ(1.0f, row[16]);
}

TEST(TemporalFeatureExtractorTest, WeekendFlag) {
    TemporalFeatureExtractor extractor(CreateHolidayCalendar("NONE"));
    FeatureVector row = extractor.Extract(MakeTransaction("t1", Day(2024, 1, 6), "X", -1.0));
    EXPECT_EQ(1.0f, row[13]);
    EXPECT_EQ(0.0f, row[8]);
    EXPECT_EQ(17u, TemporalFeatureExtractor::FeatureNames().size());
}

// ============================================================================
// Amount Features
// ============================================================================

TEST(AmountFeatureExtractorTest, LogScaledMinMax) {
    AmountFeatureExtractor extractor;
    std::vector<Transaction> txs = {
        MakeTransaction("a", Day(2024, 1, 1), "X", -10.0),
        MakeTransaction("b", Day(2024, 1, 2), "X", 100.0),
        MakeTransaction("c", Day(2024, 1, 3), "X", -1000.0),
    };
    FeatureBlock block = extractor.ExtractBatch(txs);

    ASSERT_EQ(3u, block.size());
    EXPECT_FLOAT_EQ(0.0f, block[0][0]);
    EXPECT_FLOAT_EQ(1.0f, block[2][0]);
    EXPECT_GT(block[1][0], 0.0f);
    EXPECT_LT(block[1][0], 1.0f);
}

TEST(AmountFeatureExtractorTest, IdenticalAmountsGiveHalf) {
    AmountFeatureExtractor extractor;
    std::vector<Transaction> txs = {
        MakeTransaction("a", Day(2024, 1, 1), "X", -15.49),
        MakeTransaction("b", Day(2024, 2, 1), "X", -15.49),
    };
    FeatureBlock block = extractor.ExtractBatch(txs);
    EXPECT_FLOAT_EQ(0.5f, block[0][0]);
    EXPECT_FLOAT_EQ(0.5f, block[1][0]);
}

// ============================================================================
// TF-IDF
// ============================================================================

TEST(TfidfVectorizerTest, TokenizeKeepsAlphabeticWords) {
    auto tokens = TfidfVectorizer::Tokenize("NETFLIX.COM 8443 abc123 A");
    ASSERT_EQ(2u, tokens.size());
    EXPECT_EQ("netflix", tokens[0]);
    EXPECT_EQ("com", tokens[1]);
}

TEST(TfidfVectorizerTest, AnalyzeAddsBigrams) {
    TfidfVectorizer vectorizer;
    auto terms = vectorizer.Analyze("Netflix Com");
    ASSERT_EQ(3u, terms.size());
    EXPECT_EQ("netflix com", terms[2]);
}

TEST(TfidfVectorizerTest, FitRejectsEmptyAndDegenerateCorpus) {
    TfidfVectorizer vectorizer;
    EXPECT_THROW(vectorizer.Fit({}), std::invalid_argument);
    // A term in every document exceeds max_df
    EXPECT_THROW(vectorizer.Fit({"SPOTIFY", "SPOTIFY"}), std::invalid_argument);
    EXPECT_FALSE(vectorizer.IsFitted());
}

TEST(TfidfVectorizerTest, TransformRequiresFit) {
    TfidfVectorizer vectorizer;
    EXPECT_THROW(vectorizer.Transform({"x"}), std::logic_error);
}

TEST(TfidfVectorizerTest, RowsHaveUnitNorm) {
    TfidfVectorizer vectorizer;
    auto rows = vectorizer.FitTransform({"NETFLIX COM", "SPOTIFY USA", "SHELL OIL"});

    ASSERT_EQ(3u, rows.size());
    for (const auto& row : rows) {
        EXPECT_NEAR(1.0f, row.Norm(), 1e-5);
    }
    EXPECT_LE(vectorizer.VocabularySize(), 49u);
}

TEST(TfidfVectorizerTest, MaxFeaturesKeepsMostFrequentTerms) {
    TfidfVectorizer::Config config;
    config.max_features = 1;
    config.max_ngram = 1;
    TfidfVectorizer vectorizer(config);
    vectorizer.Fit({"rent rent", "rent", "gym"});

    ASSERT_EQ(1u, vectorizer.VocabularySize());
    EXPECT_EQ(1u, vectorizer.Vocabulary().count("rent"));
}

// ============================================================================
// Description Features
// ============================================================================

TEST(DescriptionFeatureExtractorTest, PadsToFixedWidth) {
    DescriptionFeatureExtractor extractor;
    std::vector<Transaction> txs = {
        MakeTransaction("a", Day(2024, 1, 1), "NETFLIX COM", -1.0),
        MakeTransaction("b", Day(2024, 1, 2), "SPOTIFY USA", -1.0),
    };
    FeatureBlock block = extractor.ExtractBatch(txs);

    ASSERT_EQ(2u, block.size());
    EXPECT_EQ(49u, block[0].Dimension());
    EXPECT_TRUE(extractor.Warnings().empty());
    EXPECT_NE(nullptr, extractor.FittedVectorizer());
}

TEST(DescriptionFeatureExtractorTest, DegenerateCorpusFallsBackToZeros) {
    DescriptionFeatureExtractor extractor;
    std::vector<Transaction> txs = {
        MakeTransaction("a", Day(2024, 1, 1), "NETFLIX", -1.0),
        MakeTransaction("b", Day(2024, 2, 1), "NETFLIX", -1.0),
    };
    FeatureBlock block = extractor.ExtractBatch(txs);

    ASSERT_EQ(2u, block.size());
    EXPECT_FLOAT_EQ(0.0f, block[0].Norm());
    ASSERT_EQ(1u, extractor.Warnings().size());
    EXPECT_EQ(nullptr, extractor.FittedVectorizer());
}

TEST(DescriptionFeatureExtractorTest, ReusesFittedVocabulary) {
    auto vectorizer = std::make_shared<TfidfVectorizer>();
    vectorizer->Fit({"NETFLIX COM", "SPOTIFY USA"});

    DescriptionFeatureExtractor extractor(vectorizer);
    std::vector<Transaction> txs = {MakeTransaction("a", Day(2024, 1, 1), "NETFLIX COM", -1.0)};
    FeatureBlock block = extractor.ExtractBatch(txs);

    EXPECT_NEAR(1.0f, block[0].Norm(), 1e-5);
    EXPECT_EQ(vectorizer, extractor.FittedVectorizer());
}

TEST(DescriptionFeatureExtractorTest, RejectsUnfittedVectorizer) {
    EXPECT_THROW({ DescriptionFeatureExtractor extractor(std::make_shared<TfidfVectorizer>()); },
                 std::invalid_argument);
}

// ============================================================================
// Account Features
// ============================================================================

TEST(AccountFeatureExtractorTest, OneHotTypeKeywordsAndInstitution) {
    AccountsMap accounts;
    Account checking = MakeAccount("acct-1", AccountType::CHECKING, "Chase");
    checking.name = "Joint Checking";
    accounts[checking.id] = checking;

    AccountFeatureExtractor extractor(accounts);
    std::vector<Transaction> txs = {
        MakeTransaction("a", Day(2024, 1, 1), "X", -10.0, "acct-1"),
        MakeTransaction("b", Day(2024, 1, 2), "X", -30.0, "acct-1"),
    };
    FeatureBlock block = extractor.ExtractBatch(txs);

    ASSERT_EQ(2u, block.size());
    const FeatureVector& row = block[0];
    ASSERT_EQ(24u, row.Dimension());

    EXPECT_EQ(1.0f, row[0]);     // CHECKING
    EXPECT_EQ(0.0f, row[5]);     // OTHER
    EXPECT_EQ(1.0f, row[6 + 2]); // "checking"
    EXPECT_EQ(1.0f, row[6 + 5]); // "joint"
    EXPECT_EQ(0.0f, row[6 + 0]); // "business"
    EXPECT_EQ(1.0f, row[14]);    // top institution
    EXPECT_EQ(0.0f, row[18]);    // other institution

    EXPECT_FLOAT_EQ(0.002f, row[19]);          // 2 transactions / 1000
    EXPECT_FLOAT_EQ(0.05f, row[20]);           // 10 / mean 20, / 10
    EXPECT_FLOAT_EQ(1.0f, row[23]);            // active by default
}

TEST(AccountFeatureExtractorTest, UnknownAccountIsOther) {
    AccountsMap accounts;
    AccountFeatureExtractor extractor(accounts);
    std::vector<Transaction> txs = {MakeTransaction("a", Day(2024, 1, 1), "X", -10.0, "missing")};
    FeatureBlock block = extractor.ExtractBatch(txs);

    EXPECT_EQ(1.0f, block[0][5]);
    EXPECT_EQ(1.0f, block[0][18]);
}

TEST(AccountFeatureExtractorTest, InstitutionTiesKeepFirstSeenOrder) {
    AccountsMap accounts;
    accounts["a1"] = MakeAccount("a1", AccountType::CHECKING, "Zeta Bank");
    accounts["a2"] = MakeAccount("a2", AccountType::SAVINGS, "Alpha Bank");

    AccountFeatureExtractor extractor(accounts);
    std::vector<Transaction> txs = {
        MakeTransaction("a", Day(2024, 1, 1), "X", -10.0, "a1"),
        MakeTransaction("b", Day(2024, 1, 2), "X", -10.0, "a2"),
    };
    FeatureBlock block = extractor.ExtractBatch(txs);

    EXPECT_EQ(1.0f, block[0][14]);   // Zeta first
    EXPECT_EQ(1.0f, block[1][15]);
}

} // namespace
} // namespace recur
