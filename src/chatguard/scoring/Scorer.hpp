#pragma once

#include "ContentItem.hpp"
#include "scoring/ScoreVector.hpp"

#include <chrono>
#include <set>
#include <stdexcept>
#include <string>

namespace scoring {

class ScorerFault : public std::runtime_error {
public:
    explicit ScorerFault(const std::string& message)
        : std::runtime_error(message) {}
};

// A pluggable model. Score() is called concurrently from the worker pool and
// must not touch shared mutable state without its own locking.
class IScorer {
public:
    virtual ~IScorer() = default;

    virtual std::string Name() const = 0;
    virtual Modality GetModality() const = 0;
    virtual std::set<policy::RuleKind> SupportedKinds() const = 0;
    virtual std::chrono::milliseconds Timeout() const = 0;

    // Scores only the requested kinds. Throws ScorerFault when the item
    // cannot be analyzed.
    virtual ScoreVector Score(const ContentItem& item, const std::set<policy::RuleKind>& kinds) const = 0;
};

} // namespace scoring
