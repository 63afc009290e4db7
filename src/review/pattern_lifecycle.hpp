// File: src/review/pattern_lifecycle.hpp
#pragma once

#include "core/recurring_charge_pattern.hpp"
#include "core/types.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace recur {

/// Raised when a status change is not in the transition table
class InvalidTransition : public std::logic_error {
public:
    InvalidTransition(PatternStatus from, PatternStatus to, const std::string& reason = "");

    PatternStatus from() const { return from_; }
    PatternStatus to() const { return to_; }

private:
    PatternStatus from_;
    PatternStatus to_;
};

/// Raised when a pattern changed in storage since the caller read it
class TransitionConflict : public std::runtime_error {
public:
    TransitionConflict(const PatternID& id, PatternStatus expected_status,
                       uint64_t expected_version);

    const PatternID& pattern_id() const { return id_; }
    PatternStatus expected_status() const { return expected_status_; }
    uint64_t expected_version() const { return expected_version_; }

private:
    PatternID id_;
    PatternStatus expected_status_;
    uint64_t expected_version_;
};

/// PatternLifecycle - the only writer of a pattern's status
///
/// Allowed transitions:
///   DETECTED  -> CONFIRMED, REJECTED
///   CONFIRMED -> ACTIVE, REJECTED
///   ACTIVE    -> PAUSED
///   PAUSED    -> ACTIVE
/// REJECTED is terminal. The active flag follows the target status: it is
/// set only when entering ACTIVE.
class PatternLifecycle {
public:
    using Edge = std::pair<PatternStatus, PatternStatus>;

    static const std::vector<Edge>& Transitions();

    static bool IsAllowed(PatternStatus from, PatternStatus to);

    static bool IsTerminal(PatternStatus status);

    /// Whether review actions (confirm, reject, edit) apply in this status
    static bool IsReviewable(PatternStatus status);

    /// Move the pattern to a new status and record the reviewer
    /// @throws InvalidTransition if the edge is not in the table
    static void Transition(RecurringChargePattern& pattern, PatternStatus to,
                           const std::string& reviewer, EpochMillis at);
};

} // namespace recur
