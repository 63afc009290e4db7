// File: examples/basic_example.cpp
//
// Basic recurring charge detection example.
// Demonstrates:
// - Building a DetectionService with a US holiday calendar
// - Detecting patterns in a year of synthetic transactions
// - Confirming a pattern after validating its criteria
// - Predicting the next occurrences of the confirmed pattern

#include "calendar/holiday_calendar.hpp"
#include "detection/detection_service.hpp"
#include "detection/prediction_service.hpp"
#include "review/pattern_review_service.hpp"
#include "storage/memory_pattern_repository.hpp"
#include "validation/pattern_validation_service.hpp"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <iomanip>
#include <iostream>
#include <vector>

using namespace recur;

/// Transaction on a calendar day
Transaction MakeTransaction(const std::string& id, int year, int month, int day,
                            const std::string& description, double amount) {
    Transaction tx;
    tx.id = id;
    tx.account_id = "checking-1";
    tx.user_id = "demo-user";
    tx.date = ToEpochMillis(Date(year, month, day));
    tx.description = description;
    tx.amount = amount;
    return tx;
}

int main() {
    std::cout << "=== Recurring Charge Detection Example ===\n\n";

    // Step 1: Build a transaction history
    std::cout << "Step 1: Building transaction history...\n";

    std::vector<Transaction> history;
    for (int month = 1; month <= 12; ++month) {
        history.push_back(MakeTransaction("nflx-" + std::to_string(month), 2024, month, 15,
                                          "NETFLIX.COM", -15.49));
        history.push_back(MakeTransaction("gym-" + std::to_string(month), 2024, month, 3,
                                          "PLANET FITNESS CLUB", -24.99));
    }
    history.push_back(MakeTransaction("hd-1", 2024, 6, 1, "HOME DEPOT #4410", -250.00));
    history.push_back(MakeTransaction("shell-1", 2024, 9, 22, "SHELL OIL 5531", -48.12));

    std::cout << "  " << history.size() << " transactions\n\n";

    // Step 2: Detect patterns
    std::cout << "Step 2: Detecting recurring patterns...\n";

    auto holidays = CreateHolidayCalendar("US");

    DetectionService::Config config;
    config.eps = 2.5;
    DetectionService detector(config, holidays);

    DetectionResult result = detector.Detect("demo-user", history);
    std::cout << "  Clusters: " << result.stats.clusters_found
              << ", noise points: " << result.stats.noise_points << "\n";

    for (const auto& pattern : result.patterns) {
        const auto& temporal = pattern.GetTemporalCriteria();
        std::cout << "  - " << std::left << std::setw(24) << pattern.GetMerchantCriteria().pattern
                  << ToString(temporal.frequency) << " / " << ToString(temporal.pattern_type)
                  << "  confidence " << std::fixed << std::setprecision(2)
                  << pattern.GetConfidence() << "\n";
    }
    std::cout << "\n";

    if (result.patterns.empty()) {
        std::cout << "No recurring patterns found.\n";
        return 0;
    }

    // Step 3: Store and confirm the first pattern
    std::cout << "Step 3: Reviewing the first pattern...\n";

    auto repository = std::make_shared<MemoryPatternRepository>();
    auto validator = std::make_shared<PatternValidationService>(holidays);
    PatternReviewService reviews(repository, validator);

    RecurringChargePattern draft = result.patterns.front();
    if (!repository->Store(draft)) {
        std::cerr << "Failed to store pattern " << draft.GetID().ToString() << "\n";
        return 1;
    }

    ReviewResult review = reviews.Review(draft, ReviewAction::Confirm("demo-user", true), history);
    std::cout << "  Status: " << ToString(review.pattern.GetStatus())
              << ", criteria validated: " << (review.pattern.IsCriteriaValidated() ? "yes" : "no")
              << "\n";
    if (review.validation) {
        for (const auto& warning : review.validation->warnings) {
            std::cout << "  warning: " << warning << "\n";
        }
    }
    std::cout << "\n";

    // Step 4: Predict upcoming charges
    std::cout << "Step 4: Predicting the next three occurrences...\n";

    PredictionService predictor(holidays);
    EpochMillis from = ToEpochMillis(Date(2024, 12, 31));
    for (const auto& prediction : predictor.PredictMany(review.pattern, from, 3)) {
        std::cout << "  " << boost::gregorian::to_iso_extended_string(ToDate(prediction.next_expected_date))
                  << "  $" << std::fixed << std::setprecision(2) << prediction.min_amount
                  << " - $" << prediction.max_amount
                  << "  (confidence " << prediction.confidence << ")\n";
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
