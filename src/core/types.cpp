// File: src/core/types.cpp
#include "core/types.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace recur {

EpochMillis NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void RequireReadable(std::istream& in, uint64_t bytes) {
    if (bytes == 0) {
        return;
    }
    const std::streamoff here = in.tellg();
    if (here < 0) {
        throw std::runtime_error("Cannot read " + std::to_string(bytes) + " bytes from stream");
    }
    in.seekg(0, std::ios::end);
    const std::streamoff end = in.tellg();
    in.seekg(here);
    if (end < here || static_cast<uint64_t>(end - here) < bytes) {
        throw std::runtime_error("Length prefix of " + std::to_string(bytes) +
                                 " bytes exceeds remaining data");
    }
}

PatternID PatternID::Generate() {
    // random_generator is not safe to share between threads
    thread_local boost::uuids::random_generator generator;
    return PatternID(boost::uuids::to_string(generator()));
}

std::string PatternID::ToString() const {
    if (!IsValid()) {
        return "PatternID(INVALID)";
    }
    return "PatternID(" + value_ + ")";
}

void PatternID::Serialize(std::ostream& out) const {
    uint32_t length = static_cast<uint32_t>(value_.size());
    out.write(reinterpret_cast<const char*>(&length), sizeof(length));
    out.write(value_.data(), length);
}

PatternID PatternID::Deserialize(std::istream& in) {
    uint32_t length = 0;
    in.read(reinterpret_cast<char*>(&length), sizeof(length));
    RequireReadable(in, length);
    std::string value(length, '\0');
    in.read(&value[0], length);
    return PatternID(std::move(value));
}

// Enum implementations

const char* ToString(RecurrenceFrequency frequency) {
    switch (frequency) {
        case RecurrenceFrequency::DAILY: return "DAILY";
        case RecurrenceFrequency::WEEKLY: return "WEEKLY";
        case RecurrenceFrequency::BI_WEEKLY: return "BI_WEEKLY";
        case RecurrenceFrequency::SEMI_MONTHLY: return "SEMI_MONTHLY";
        case RecurrenceFrequency::MONTHLY: return "MONTHLY";
        case RecurrenceFrequency::BI_MONTHLY: return "BI_MONTHLY";
        case RecurrenceFrequency::QUARTERLY: return "QUARTERLY";
        case RecurrenceFrequency::SEMI_ANNUALLY: return "SEMI_ANNUALLY";
        case RecurrenceFrequency::ANNUALLY: return "ANNUALLY";
        case RecurrenceFrequency::IRREGULAR: return "IRREGULAR";
        default: return "UNKNOWN";
    }
}

RecurrenceFrequency ParseRecurrenceFrequency(const std::string& str) {
    if (str == "DAILY") return RecurrenceFrequency::DAILY;
    if (str == "WEEKLY") return RecurrenceFrequency::WEEKLY;
    if (str == "BI_WEEKLY") return RecurrenceFrequency::BI_WEEKLY;
    if (str == "SEMI_MONTHLY") return RecurrenceFrequency::SEMI_MONTHLY;
    if (str == "MONTHLY") return RecurrenceFrequency::MONTHLY;
    if (str == "BI_MONTHLY") return RecurrenceFrequency::BI_MONTHLY;
    if (str == "QUARTERLY") return RecurrenceFrequency::QUARTERLY;
    if (str == "SEMI_ANNUALLY") return RecurrenceFrequency::SEMI_ANNUALLY;
    if (str == "ANNUALLY") return RecurrenceFrequency::ANNUALLY;
    if (str == "IRREGULAR") return RecurrenceFrequency::IRREGULAR;
    throw std::invalid_argument("Unknown RecurrenceFrequency: " + str);
}

const char* ToString(TemporalPatternType type) {
    switch (type) {
        case TemporalPatternType::DAY_OF_WEEK: return "DAY_OF_WEEK";
        case TemporalPatternType::DAY_OF_MONTH: return "DAY_OF_MONTH";
        case TemporalPatternType::FIRST_WORKING_DAY: return "FIRST_WORKING_DAY";
        case TemporalPatternType::LAST_WORKING_DAY: return "LAST_WORKING_DAY";
        case TemporalPatternType::FIRST_WEEKDAY_OF_MONTH: return "FIRST_WEEKDAY_OF_MONTH";
        case TemporalPatternType::LAST_WEEKDAY_OF_MONTH: return "LAST_WEEKDAY_OF_MONTH";
        case TemporalPatternType::WEEKEND: return "WEEKEND";
        case TemporalPatternType::WEEKDAY: return "WEEKDAY";
        case TemporalPatternType::FLEXIBLE: return "FLEXIBLE";
        default: return "UNKNOWN";
    }
}

TemporalPatternType ParseTemporalPatternType(const std::string& str) {
    if (str == "DAY_OF_WEEK") return TemporalPatternType::DAY_OF_WEEK;
    if (str == "DAY_OF_MONTH") return TemporalPatternType::DAY_OF_MONTH;
    if (str == "FIRST_WORKING_DAY") return TemporalPatternType::FIRST_WORKING_DAY;
    if (str == "LAST_WORKING_DAY") return TemporalPatternType::LAST_WORKING_DAY;
    if (str == "FIRST_WEEKDAY_OF_MONTH") return TemporalPatternType::FIRST_WEEKDAY_OF_MONTH;
    if (str == "LAST_WEEKDAY_OF_MONTH") return TemporalPatternType::LAST_WEEKDAY_OF_MONTH;
    if (str == "WEEKEND") return TemporalPatternType::WEEKEND;
    if (str == "WEEKDAY") return TemporalPatternType::WEEKDAY;
    if (str == "FLEXIBLE") return TemporalPatternType::FLEXIBLE;
    throw std::invalid_argument("Unknown TemporalPatternType: " + str);
}

const char* ToString(AccountType type) {
    switch (type) {
        case AccountType::CHECKING: return "CHECKING";
        case AccountType::SAVINGS: return "SAVINGS";
        case AccountType::CREDIT_CARD: return "CREDIT_CARD";
        case AccountType::INVESTMENT: return "INVESTMENT";
        case AccountType::LOAN: return "LOAN";
        case AccountType::OTHER: return "OTHER";
        default: return "UNKNOWN";
    }
}

AccountType ParseAccountType(const std::string& str) {
    if (str == "CHECKING") return AccountType::CHECKING;
    if (str == "SAVINGS") return AccountType::SAVINGS;
    if (str == "CREDIT_CARD") return AccountType::CREDIT_CARD;
    if (str == "INVESTMENT") return AccountType::INVESTMENT;
    if (str == "LOAN") return AccountType::LOAN;
    if (str == "OTHER") return AccountType::OTHER;
    throw std::invalid_argument("Unknown AccountType: " + str);
}

const char* ToString(PatternStatus status) {
    switch (status) {
        case PatternStatus::DETECTED: return "DETECTED";
        case PatternStatus::CONFIRMED: return "CONFIRMED";
        case PatternStatus::ACTIVE: return "ACTIVE";
        case PatternStatus::PAUSED: return "PAUSED";
        case PatternStatus::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

PatternStatus ParsePatternStatus(const std::string& str) {
    if (str == "DETECTED") return PatternStatus::DETECTED;
    if (str == "CONFIRMED") return PatternStatus::CONFIRMED;
    if (str == "ACTIVE") return PatternStatus::ACTIVE;
    if (str == "PAUSED") return PatternStatus::PAUSED;
    if (str == "REJECTED") return PatternStatus::REJECTED;
    throw std::invalid_argument("Unknown PatternStatus: " + str);
}

const char* ToString(MatchType type) {
    switch (type) {
        case MatchType::CONTAINS: return "CONTAINS";
        case MatchType::EXACT: return "EXACT";
        case MatchType::PREFIX: return "PREFIX";
        case MatchType::SUFFIX: return "SUFFIX";
        case MatchType::REGEX: return "REGEX";
        default: return "UNKNOWN";
    }
}

MatchType ParseMatchType(const std::string& str) {
    if (str == "CONTAINS") return MatchType::CONTAINS;
    if (str == "EXACT") return MatchType::EXACT;
    if (str == "PREFIX") return MatchType::PREFIX;
    if (str == "SUFFIX") return MatchType::SUFFIX;
    if (str == "REGEX") return MatchType::REGEX;
    throw std::invalid_argument("Unknown MatchType: " + str);
}

} // namespace recur
