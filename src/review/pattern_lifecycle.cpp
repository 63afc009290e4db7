// File: src/review/pattern_lifecycle.cpp
#include "review/pattern_lifecycle.hpp"
#include <algorithm>

namespace recur {

namespace {

std::string TransitionMessage(PatternStatus from, PatternStatus to, const std::string& reason) {
    std::string message = std::string("Invalid pattern transition ") + ToString(from) +
                          " -> " + ToString(to);
    if (!reason.empty()) {
        message += ": " + reason;
    }
    return message;
}

} // anonymous namespace

InvalidTransition::InvalidTransition(PatternStatus from, PatternStatus to,
                                     const std::string& reason)
    : std::logic_error(TransitionMessage(from, to, reason)), from_(from), to_(to) {}

TransitionConflict::TransitionConflict(const PatternID& id, PatternStatus expected_status,
                                       uint64_t expected_version)
    : std::runtime_error("Pattern " + id.ToString() + " is no longer " +
                         ToString(expected_status) + " at version " +
                         std::to_string(expected_version)),
      id_(id),
      expected_status_(expected_status),
      expected_version_(expected_version) {}

const std::vector<PatternLifecycle::Edge>& PatternLifecycle::Transitions() {
    static const std::vector<Edge> kTransitions = {
        {PatternStatus::DETECTED, PatternStatus::CONFIRMED},
        {PatternStatus::DETECTED, PatternStatus::REJECTED},
        {PatternStatus::CONFIRMED, PatternStatus::ACTIVE},
        {PatternStatus::CONFIRMED, PatternStatus::REJECTED},
        {PatternStatus::ACTIVE, PatternStatus::PAUSED},
        {PatternStatus::PAUSED, PatternStatus::ACTIVE},
    };
    return kTransitions;
}

bool PatternLifecycle::IsAllowed(PatternStatus from, PatternStatus to) {
    const auto& table = Transitions();
    return std::find(table.begin(), table.end(), Edge{from, to}) != table.end();
}

bool PatternLifecycle::IsTerminal(PatternStatus status) {
    const auto& table = Transitions();
    return std::none_of(table.begin(), table.end(),
                        [status](const Edge& edge) { return edge.first == status; });
}

bool PatternLifecycle::IsReviewable(PatternStatus status) {
    return status == PatternStatus::DETECTED || status == PatternStatus::CONFIRMED;
}

void PatternLifecycle::Transition(RecurringChargePattern& pattern, PatternStatus to,
                                  const std::string& reviewer, EpochMillis at) {
    if (!IsAllowed(pattern.GetStatus(), to)) {
        throw InvalidTransition(pattern.GetStatus(), to);
    }
    pattern.SetStatus(to);
    pattern.SetActive(to == PatternStatus::ACTIVE);
    pattern.RecordReview(reviewer, at);
}

} // namespace recur
