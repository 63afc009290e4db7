// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <iosfwd>

namespace recur {

/// Milliseconds since the Unix epoch, interpreted as UTC
using EpochMillis = int64_t;

constexpr EpochMillis kMillisPerDay = 86400000LL;

/// Current wall-clock time
EpochMillis NowMillis();

/// Throws std::runtime_error unless `bytes` more bytes can still be read from `in`
void RequireReadable(std::istream& in, uint64_t bytes);

// PatternID: Unique identifier for recurring charge patterns
// Random UUIDs so identifiers stay unique across independent detection runs
class PatternID {
public:
    // Default constructor creates invalid ID
    PatternID() = default;

    // Explicit constructor from an existing identifier string
    explicit PatternID(std::string value) : value_(std::move(value)) {}

    // Generate new random ID (thread-safe)
    static PatternID Generate();

    // Check if ID is valid
    bool IsValid() const { return !value_.empty(); }

    // Get underlying value
    const std::string& value() const { return value_; }

    // Comparison operators
    bool operator==(const PatternID& other) const { return value_ == other.value_; }
    bool operator!=(const PatternID& other) const { return value_ != other.value_; }
    bool operator<(const PatternID& other) const { return value_ < other.value_; }

    // String conversion for debugging
    std::string ToString() const;

    // Serialization
    void Serialize(std::ostream& out) const;
    static PatternID Deserialize(std::istream& in);

    // Hash support for std::unordered_map
    struct Hash {
        size_t operator()(const PatternID& id) const {
            return std::hash<std::string>()(id.value_);
        }
    };

private:
    std::string value_;
};

// RecurrenceFrequency: How often a recurring charge repeats
enum class RecurrenceFrequency : uint8_t {
    DAILY = 0,
    WEEKLY = 1,
    BI_WEEKLY = 2,
    SEMI_MONTHLY = 3,
    MONTHLY = 4,
    BI_MONTHLY = 5,
    QUARTERLY = 6,
    SEMI_ANNUALLY = 7,
    ANNUALLY = 8,
    IRREGULAR = 9,    // No bucket fits the interval distribution
};

const char* ToString(RecurrenceFrequency frequency);
RecurrenceFrequency ParseRecurrenceFrequency(const std::string& str);

// TemporalPatternType: Shape of the recurrence within a month or week
enum class TemporalPatternType : uint8_t {
    DAY_OF_WEEK = 0,             // Same weekday every time
    DAY_OF_MONTH = 1,            // Same calendar day every time
    FIRST_WORKING_DAY = 2,       // First business day of the month
    LAST_WORKING_DAY = 3,        // Last business day of the month
    FIRST_WEEKDAY_OF_MONTH = 4,  // e.g. first Monday of the month
    LAST_WEEKDAY_OF_MONTH = 5,   // e.g. last Friday of the month
    WEEKEND = 6,
    WEEKDAY = 7,
    FLEXIBLE = 8,                // No consistent shape
};

const char* ToString(TemporalPatternType type);
TemporalPatternType ParseTemporalPatternType(const std::string& str);

// AccountType: Kind of financial account a transaction belongs to
// Order matters: it is the one-hot order of the account features
enum class AccountType : uint8_t {
    CHECKING = 0,
    SAVINGS = 1,
    CREDIT_CARD = 2,
    INVESTMENT = 3,
    LOAN = 4,
    OTHER = 5,
};

constexpr size_t kAccountTypeCount = 6;

const char* ToString(AccountType type);
AccountType ParseAccountType(const std::string& str);

// PatternStatus: Review lifecycle state of a pattern
enum class PatternStatus : uint8_t {
    DETECTED = 0,
    CONFIRMED = 1,
    ACTIVE = 2,
    PAUSED = 3,
    REJECTED = 4,
};

const char* ToString(PatternStatus status);
PatternStatus ParsePatternStatus(const std::string& str);

// MatchType: How a merchant pattern is compared to a description
enum class MatchType : uint8_t {
    CONTAINS = 0,
    EXACT = 1,
    PREFIX = 2,
    SUFFIX = 3,
    REGEX = 4,
};

const char* ToString(MatchType type);
MatchType ParseMatchType(const std::string& str);

} // namespace recur
