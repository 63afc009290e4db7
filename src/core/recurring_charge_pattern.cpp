// File: src/core/recurring_charge_pattern.cpp
#include "core/recurring_charge_pattern.hpp"
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace recur {

namespace {

constexpr uint8_t kSerializationVersion = 1;

template <typename T>
void WritePod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T>
T ReadPod(std::istream& in) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return value;
}

void WriteString(std::ostream& out, const std::string& value) {
    WritePod<uint32_t>(out, static_cast<uint32_t>(value.size()));
    out.write(value.data(), value.size());
}

std::string ReadString(std::istream& in) {
    uint32_t length = ReadPod<uint32_t>(in);
    RequireReadable(in, length);
    std::string value(length, '\0');
    in.read(&value[0], length);
    return value;
}

void WriteStrings(std::ostream& out, const std::vector<std::string>& values) {
    WritePod<uint32_t>(out, static_cast<uint32_t>(values.size()));
    for (const auto& value : values) {
        WriteString(out, value);
    }
}

std::vector<std::string> ReadStrings(std::istream& in) {
    uint32_t count = ReadPod<uint32_t>(in);
    // Every entry carries at least its own length prefix
    RequireReadable(in, static_cast<uint64_t>(count) * sizeof(uint32_t));
    std::vector<std::string> values;
    values.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        values.push_back(ReadString(in));
    }
    return values;
}

template <typename T>
void WriteOptional(std::ostream& out, const std::optional<T>& value) {
    WritePod<uint8_t>(out, value.has_value() ? 1 : 0);
    if (value) {
        WritePod<T>(out, *value);
    }
}

template <typename T>
std::optional<T> ReadOptional(std::istream& in) {
    if (ReadPod<uint8_t>(in) == 0) {
        return std::nullopt;
    }
    return ReadPod<T>(in);
}

void WriteOptionalString(std::ostream& out, const std::optional<std::string>& value) {
    WritePod<uint8_t>(out, value.has_value() ? 1 : 0);
    if (value) {
        WriteString(out, *value);
    }
}

std::optional<std::string> ReadOptionalString(std::istream& in) {
    if (ReadPod<uint8_t>(in) == 0) {
        return std::nullopt;
    }
    return ReadString(in);
}

} // anonymous namespace

// ============================================================================
// Criteria
// ============================================================================

bool MerchantCriteria::operator==(const MerchantCriteria& other) const {
    return pattern == other.pattern &&
           match_type == other.match_type &&
           exclusions == other.exclusions &&
           case_sensitive == other.case_sensitive;
}

bool AmountCriteria::operator==(const AmountCriteria& other) const {
    return mean == other.mean &&
           std_dev == other.std_dev &&
           min == other.min &&
           max == other.max &&
           tolerance_pct == other.tolerance_pct;
}

bool TemporalCriteria::operator==(const TemporalCriteria& other) const {
    return frequency == other.frequency &&
           pattern_type == other.pattern_type &&
           day_of_week == other.day_of_week &&
           day_of_month == other.day_of_month &&
           tolerance_days == other.tolerance_days;
}

// ============================================================================
// RecurringChargePattern
// ============================================================================

RecurringChargePattern::RecurringChargePattern(
    PatternID id, std::string user_id,
    std::vector<std::string> matched_transaction_ids)
    : id_(std::move(id)),
      user_id_(std::move(user_id)),
      matched_transaction_ids_(std::move(matched_transaction_ids)) {}

void RecurringChargePattern::SetConfidence(double confidence) {
    if (!(confidence >= 0.0 && confidence <= 1.0)) {
        throw std::invalid_argument(
            "confidence must be in [0, 1], got " + std::to_string(confidence));
    }
    confidence_ = confidence;
}

void RecurringChargePattern::SetOccurrenceRange(EpochMillis first, EpochMillis last) {
    if (last < first) {
        throw std::invalid_argument("last occurrence precedes first occurrence");
    }
    first_occurrence_ = first;
    last_occurrence_ = last;
}

void RecurringChargePattern::SetFeatureVector(FeatureVector vector, FeatureMode mode) {
    if (vector.Dimension() != FeatureWidth(mode)) {
        throw std::invalid_argument(
            "feature vector has " + std::to_string(vector.Dimension()) +
            " values, mode " + recur::ToString(mode) + " requires " +
            std::to_string(FeatureWidth(mode)));
    }
    feature_vector_ = std::move(vector);
    feature_mode_ = mode;
}

void RecurringChargePattern::SetCriteriaValidation(bool validated,
                                                   std::vector<std::string> errors) {
    criteria_validated_ = validated;
    criteria_validation_errors_ = std::move(errors);
}

void RecurringChargePattern::RecordReview(const std::string& reviewer, EpochMillis at) {
    reviewed_by_ = reviewer;
    reviewed_at_ = at;
    updated_at_ = at;
}

void RecurringChargePattern::Serialize(std::ostream& out) const {
    WritePod<uint8_t>(out, kSerializationVersion);

    id_.Serialize(out);
    WriteString(out, user_id_);
    WriteStrings(out, matched_transaction_ids_);

    WriteString(out, merchant_.pattern);
    WritePod<uint8_t>(out, static_cast<uint8_t>(merchant_.match_type));
    WriteStrings(out, merchant_.exclusions);
    WritePod<uint8_t>(out, merchant_.case_sensitive ? 1 : 0);

    WritePod<double>(out, amount_.mean);
    WritePod<double>(out, amount_.std_dev);
    WritePod<double>(out, amount_.min);
    WritePod<double>(out, amount_.max);
    WritePod<double>(out, amount_.tolerance_pct);

    WritePod<uint8_t>(out, static_cast<uint8_t>(temporal_.frequency));
    WritePod<uint8_t>(out, static_cast<uint8_t>(temporal_.pattern_type));
    WriteOptional<int32_t>(out, temporal_.day_of_week
        ? std::optional<int32_t>(*temporal_.day_of_week) : std::nullopt);
    WriteOptional<int32_t>(out, temporal_.day_of_month
        ? std::optional<int32_t>(*temporal_.day_of_month) : std::nullopt);
    WritePod<int32_t>(out, temporal_.tolerance_days);

    WritePod<double>(out, confidence_);
    WritePod<uint64_t>(out, transaction_count_);
    WritePod<int64_t>(out, first_occurrence_);
    WritePod<int64_t>(out, last_occurrence_);
    feature_vector_.Serialize(out);
    WritePod<uint8_t>(out, static_cast<uint8_t>(feature_mode_));
    WritePod<int32_t>(out, cluster_id_);

    WriteOptionalString(out, suggested_category_id_);
    WritePod<uint8_t>(out, auto_categorize_ ? 1 : 0);

    WritePod<uint8_t>(out, criteria_validated_ ? 1 : 0);
    WriteStrings(out, criteria_validation_errors_);

    WritePod<uint8_t>(out, static_cast<uint8_t>(status_));
    WriteOptionalString(out, reviewed_by_);
    WriteOptional<int64_t>(out, reviewed_at_);
    WritePod<uint8_t>(out, active_ ? 1 : 0);

    WritePod<int64_t>(out, created_at_);
    WritePod<int64_t>(out, updated_at_);
    WritePod<uint64_t>(out, version_);
}

RecurringChargePattern RecurringChargePattern::Deserialize(std::istream& in) {
    uint8_t version = ReadPod<uint8_t>(in);
    if (version != kSerializationVersion) {
        throw std::runtime_error(
            "Unsupported pattern serialization version: " + std::to_string(version));
    }

    PatternID id = PatternID::Deserialize(in);
    std::string user_id = ReadString(in);
    std::vector<std::string> matched = ReadStrings(in);
    RecurringChargePattern pattern(std::move(id), std::move(user_id), std::move(matched));

    pattern.merchant_.pattern = ReadString(in);
    pattern.merchant_.match_type = static_cast<MatchType>(ReadPod<uint8_t>(in));
    pattern.merchant_.exclusions = ReadStrings(in);
    pattern.merchant_.case_sensitive = ReadPod<uint8_t>(in) != 0;

    pattern.amount_.mean = ReadPod<double>(in);
    pattern.amount_.std_dev = ReadPod<double>(in);
    pattern.amount_.min = ReadPod<double>(in);
    pattern.amount_.max = ReadPod<double>(in);
    pattern.amount_.tolerance_pct = ReadPod<double>(in);

    pattern.temporal_.frequency = static_cast<RecurrenceFrequency>(ReadPod<uint8_t>(in));
    pattern.temporal_.pattern_type = static_cast<TemporalPatternType>(ReadPod<uint8_t>(in));
    auto day_of_week = ReadOptional<int32_t>(in);
    auto day_of_month = ReadOptional<int32_t>(in);
    if (day_of_week) pattern.temporal_.day_of_week = *day_of_week;
    if (day_of_month) pattern.temporal_.day_of_month = *day_of_month;
    pattern.temporal_.tolerance_days = ReadPod<int32_t>(in);

    pattern.confidence_ = ReadPod<double>(in);
    pattern.transaction_count_ = static_cast<size_t>(ReadPod<uint64_t>(in));
    pattern.first_occurrence_ = ReadPod<int64_t>(in);
    pattern.last_occurrence_ = ReadPod<int64_t>(in);
    pattern.feature_vector_ = FeatureVector::Deserialize(in);
    pattern.feature_mode_ = static_cast<FeatureMode>(ReadPod<uint8_t>(in));
    pattern.cluster_id_ = ReadPod<int32_t>(in);

    pattern.suggested_category_id_ = ReadOptionalString(in);
    pattern.auto_categorize_ = ReadPod<uint8_t>(in) != 0;

    pattern.criteria_validated_ = ReadPod<uint8_t>(in) != 0;
    pattern.criteria_validation_errors_ = ReadStrings(in);

    pattern.status_ = static_cast<PatternStatus>(ReadPod<uint8_t>(in));
    pattern.reviewed_by_ = ReadOptionalString(in);
    pattern.reviewed_at_ = ReadOptional<int64_t>(in);
    pattern.active_ = ReadPod<uint8_t>(in) != 0;

    pattern.created_at_ = ReadPod<int64_t>(in);
    pattern.updated_at_ = ReadPod<int64_t>(in);
    pattern.version_ = ReadPod<uint64_t>(in);

    if (!in) {
        throw std::runtime_error("Truncated pattern data for " + pattern.id_.ToString());
    }
    return pattern;
}

std::string RecurringChargePattern::ToString() const {
    std::ostringstream oss;
    oss << "RecurringChargePattern{id=" << id_.value()
        << ", merchant=\"" << merchant_.pattern << "\""
        << ", frequency=" << recur::ToString(temporal_.frequency)
        << ", shape=" << recur::ToString(temporal_.pattern_type)
        << ", amount=" << amount_.mean
        << ", confidence=" << confidence_
        << ", transactions=" << matched_transaction_ids_.size()
        << ", status=" << recur::ToString(status_)
        << ", active=" << (active_ ? "true" : "false") << "}";
    return oss.str();
}

bool RecurringChargePattern::operator==(const RecurringChargePattern& other) const {
    return id_ == other.id_ &&
           user_id_ == other.user_id_ &&
           matched_transaction_ids_ == other.matched_transaction_ids_ &&
           merchant_ == other.merchant_ &&
           amount_ == other.amount_ &&
           temporal_ == other.temporal_ &&
           confidence_ == other.confidence_ &&
           transaction_count_ == other.transaction_count_ &&
           first_occurrence_ == other.first_occurrence_ &&
           last_occurrence_ == other.last_occurrence_ &&
           feature_vector_ == other.feature_vector_ &&
           feature_mode_ == other.feature_mode_ &&
           cluster_id_ == other.cluster_id_ &&
           suggested_category_id_ == other.suggested_category_id_ &&
           auto_categorize_ == other.auto_categorize_ &&
           criteria_validated_ == other.criteria_validated_ &&
           criteria_validation_errors_ == other.criteria_validation_errors_ &&
           status_ == other.status_ &&
           reviewed_by_ == other.reviewed_by_ &&
           reviewed_at_ == other.reviewed_at_ &&
           active_ == other.active_ &&
           created_at_ == other.created_at_ &&
           updated_at_ == other.updated_at_ &&
           version_ == other.version_;
}

} // namespace recur
