#pragma once

#include "policy/Rule.hpp"

#include <chrono>
#include <string>

struct ModerationResult {
    bool isViolation = false;
    policy::RuleKind kind = policy::RuleKind::None;
    double confidence = 0.0;
    policy::RuleAction action = policy::RuleAction::None;
    bool cached = false;
    std::chrono::microseconds latency{0};

    // One or more scorers timed out or failed; unknown scores were treated
    // as non-violating.
    bool degraded = false;

    // The action was downgraded to log because the source exhausted its
    // rate budget.
    bool throttled = false;

    bool rejected = false;
    std::string rejectionReason;
    std::string reason;
    std::string contentHash;
};

inline bool operator==(const ModerationResult& lhs, const ModerationResult& rhs) {
    return lhs.isViolation == rhs.isViolation && lhs.kind == rhs.kind && lhs.confidence == rhs.confidence
        && lhs.action == rhs.action && lhs.cached == rhs.cached && lhs.latency == rhs.latency
        && lhs.degraded == rhs.degraded && lhs.throttled == rhs.throttled && lhs.rejected == rhs.rejected
        && lhs.rejectionReason == rhs.rejectionReason && lhs.reason == rhs.reason
        && lhs.contentHash == rhs.contentHash;
}

inline bool operator!=(const ModerationResult& lhs, const ModerationResult& rhs) {
    return !(lhs == rhs);
}
