#include "scoring/ScoreVector.hpp"

#include <algorithm>

namespace scoring {

void ScoreVector::Set(policy::RuleKind kind, double confidence) {
    confidence = std::min(1.0, std::max(0.0, confidence));

    auto iter = known_.find(kind);
    if (iter == known_.end()) {
        known_.emplace(kind, confidence);
    } else {
        iter->second = std::max(iter->second, confidence);
    }
}

void ScoreVector::MarkUnknown(policy::RuleKind kind) { unknown_.insert(kind); }

void ScoreVector::Merge(const ScoreVector& other) {
    for (const auto& score : other.known_) {
        Set(score.first, score.second);
    }

    unknown_.insert(other.unknown_.begin(), other.unknown_.end());
}

boost::optional<double> ScoreVector::Get(policy::RuleKind kind) const {
    auto iter = known_.find(kind);
    if (iter == known_.end()) {
        return boost::none;
    }

    return iter->second;
}

} // namespace scoring
