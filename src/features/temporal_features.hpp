// File: src/features/temporal_features.hpp
#pragma once

#include "calendar/holiday_calendar.hpp"
#include "features/feature_extractor.hpp"
#include <memory>
#include <string>
#include <vector>

namespace recur {

/// TemporalFeatureExtractor - calendar position of each transaction
///
/// Produces 17 values per transaction:
/// - 8 circular encodings (sin, cos) of day of week, day of month,
///   position in month and week of month
/// - 8 flags: working day, first working day, last working day,
///   first weekday occurrence, last weekday occurrence, weekend,
///   first calendar day, last calendar day
/// - 1 normalized day position in the month
class TemporalFeatureExtractor {
public:
    static constexpr size_t kFeatureSize = 17;

    /// @param holidays Calendar deciding which weekdays are not working days
    explicit TemporalFeatureExtractor(std::shared_ptr<const HolidayCalendar> holidays);

    size_t FeatureSize() const { return kFeatureSize; }

    FeatureBlock ExtractBatch(const std::vector<Transaction>& transactions);

    /// Features for a single transaction
    FeatureVector Extract(const Transaction& transaction) const;

    /// Column names in output order
    static std::vector<std::string> FeatureNames();

private:
    BusinessCalendar calendar_;
};

} // namespace recur
