// File: src/analysis/frequency_analyzer.hpp
#pragma once

#include "core/transaction.hpp"
#include "core/types.hpp"
#include <utility>
#include <vector>

namespace recur {

/// Interval window, in days, of one frequency bucket
struct FrequencyWindow {
    RecurrenceFrequency frequency;
    double min_days;
    double max_days;
};

/// Standard bucket windows
std::vector<FrequencyWindow> DefaultFrequencyWindows();

/// Summary of the gaps between consecutive occurrences, in days
struct IntervalStatistics {
    double mean{0.0};
    double std_dev{0.0};
    double min{0.0};
    double max{0.0};
    double median{0.0};
    size_t count{0};
};

/// FrequencyAnalyzer - classifies the spacing of a cluster's occurrences
///
/// Each interval is tested against every bucket window. The bucket holding
/// the most intervals wins when it holds a strict majority of them; ties go
/// to the bucket listed first. Otherwise the result is IRREGULAR.
class FrequencyAnalyzer {
public:
    struct Config {
        /// Buckets in priority order
        std::vector<FrequencyWindow> windows{DefaultFrequencyWindows()};
    };

    FrequencyAnalyzer();

    /// @throws std::invalid_argument if a window is empty or inverted
    explicit FrequencyAnalyzer(const Config& config);

    /// Frequency of a cluster (order of input does not matter)
    RecurrenceFrequency Analyze(const std::vector<Transaction>& transactions) const;

    /// Frequency of a list of intervals in days
    RecurrenceFrequency ClassifyIntervals(const std::vector<double>& intervals) const;

    IntervalStatistics GetIntervalStatistics(const std::vector<Transaction>& transactions) const;

    /// Sorted consecutive gaps in fractional days
    static std::vector<double> CalculateIntervals(const std::vector<Transaction>& transactions);

    /// Nominal period of a frequency in days, 0 for IRREGULAR
    static double NominalDays(RecurrenceFrequency frequency);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace recur
