#pragma once

#include "policy/Rule.hpp"

#include <boost/optional.hpp>

#include <map>
#include <set>

namespace scoring {

// Confidence per rule kind, plus the kinds a scorer could not answer for.
// Several units (video frames, attachments) merge by taking the highest
// known confidence.
class ScoreVector {
public:
    // Clamps confidence into [0,1]; keeps the higher value when the kind is
    // already scored.
    void Set(policy::RuleKind kind, double confidence);
    void MarkUnknown(policy::RuleKind kind);
    void Merge(const ScoreVector& other);

    boost::optional<double> Get(policy::RuleKind kind) const;
    bool IsUnknown(policy::RuleKind kind) const { return unknown_.count(kind) > 0; }

    // True when at least one requested kind could not be scored.
    bool Degraded() const { return !unknown_.empty(); }

    const std::map<policy::RuleKind, double>& Known() const { return known_; }
    const std::set<policy::RuleKind>& Unknown() const { return unknown_; }

private:
    std::map<policy::RuleKind, double> known_;
    std::set<policy::RuleKind> unknown_;
};

} // namespace scoring
