// File: src/analysis/frequency_analyzer.cpp
#include "analysis/frequency_analyzer.hpp"
#include "analysis/statistics.hpp"
#include <algorithm>
#include <stdexcept>

namespace recur {

FrequencyAnalyzer::FrequencyAnalyzer() : FrequencyAnalyzer(Config{}) {}

FrequencyAnalyzer::FrequencyAnalyzer(const Config& config) : config_(config) {
    if (config_.windows.empty()) {
        throw std::invalid_argument("FrequencyAnalyzer requires at least one window");
    }
    for (const auto& window : config_.windows) {
        if (window.frequency == RecurrenceFrequency::IRREGULAR) {
            throw std::invalid_argument("IRREGULAR cannot have a window");
        }
        if (!(window.min_days >= 0.0) || window.max_days < window.min_days) {
            throw std::invalid_argument(
                std::string("Invalid window for ") + ToString(window.frequency));
        }
    }
}

std::vector<FrequencyWindow> DefaultFrequencyWindows() {
    return {
        {RecurrenceFrequency::DAILY, 0.5, 1.5},
        {RecurrenceFrequency::WEEKLY, 6.0, 8.0},
        {RecurrenceFrequency::BI_WEEKLY, 12.0, 16.0},
        {RecurrenceFrequency::SEMI_MONTHLY, 13.0, 17.0},
        {RecurrenceFrequency::MONTHLY, 25.0, 35.0},
        {RecurrenceFrequency::BI_MONTHLY, 55.0, 65.0},
        {RecurrenceFrequency::QUARTERLY, 85.0, 95.0},
        {RecurrenceFrequency::SEMI_ANNUALLY, 175.0, 190.0},
        {RecurrenceFrequency::ANNUALLY, 355.0, 375.0},
    };
}

double FrequencyAnalyzer::NominalDays(RecurrenceFrequency frequency) {
    switch (frequency) {
        case RecurrenceFrequency::DAILY: return 1.0;
        case RecurrenceFrequency::WEEKLY: return 7.0;
        case RecurrenceFrequency::BI_WEEKLY: return 14.0;
        case RecurrenceFrequency::SEMI_MONTHLY: return 15.0;
        case RecurrenceFrequency::MONTHLY: return 30.0;
        case RecurrenceFrequency::BI_MONTHLY: return 61.0;
        case RecurrenceFrequency::QUARTERLY: return 91.0;
        case RecurrenceFrequency::SEMI_ANNUALLY: return 182.0;
        case RecurrenceFrequency::ANNUALLY: return 365.0;
        default: return 0.0;
    }
}

std::vector<double> FrequencyAnalyzer::CalculateIntervals(
    const std::vector<Transaction>& transactions) {
    std::vector<EpochMillis> dates;
    dates.reserve(transactions.size());
    for (const auto& tx : transactions) {
        dates.push_back(tx.date);
    }
    std::sort(dates.begin(), dates.end());

    std::vector<double> intervals;
    for (size_t i = 1; i < dates.size(); ++i) {
        intervals.push_back(static_cast<double>(dates[i] - dates[i - 1]) /
                            static_cast<double>(kMillisPerDay));
    }
    return intervals;
}

RecurrenceFrequency FrequencyAnalyzer::Analyze(
    const std::vector<Transaction>& transactions) const {
    return ClassifyIntervals(CalculateIntervals(transactions));
}

RecurrenceFrequency FrequencyAnalyzer::ClassifyIntervals(
    const std::vector<double>& intervals) const {
    if (intervals.empty()) {
        return RecurrenceFrequency::IRREGULAR;
    }

    const FrequencyWindow* best = nullptr;
    size_t best_hits = 0;
    for (const auto& window : config_.windows) {
        size_t hits = static_cast<size_t>(std::count_if(
            intervals.begin(), intervals.end(), [&window](double days) {
                return days >= window.min_days && days <= window.max_days;
            }));
        if (hits > best_hits) {
            best = &window;
            best_hits = hits;
        }
    }

    if (best && best_hits * 2 > intervals.size()) {
        return best->frequency;
    }
    return RecurrenceFrequency::IRREGULAR;
}

IntervalStatistics FrequencyAnalyzer::GetIntervalStatistics(
    const std::vector<Transaction>& transactions) const {
    IntervalStatistics result;
    std::vector<double> intervals = CalculateIntervals(transactions);
    if (intervals.empty()) {
        return result;
    }

    result.mean = stats::Mean(intervals);
    result.std_dev = stats::StdDev(intervals);
    result.min = *std::min_element(intervals.begin(), intervals.end());
    result.max = *std::max_element(intervals.begin(), intervals.end());
    result.median = stats::Median(intervals);
    result.count = intervals.size();
    return result;
}

} // namespace recur
