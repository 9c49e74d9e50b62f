#pragma once

#include "scoring/Scorer.hpp"

#include <map>
#include <vector>

namespace scoring {

// Keyword and heuristic text model. Any keyword match starts at 0.6 and
// grows with the share of the list that matched, capped at 0.95. Repeated
// words push spam up by 0.3; caps is the share of upper-case letters.
class KeywordTextScorer : public IScorer {
public:
    explicit KeywordTextScorer(std::chrono::milliseconds timeout);

    std::string Name() const override { return "keyword-text"; }
    Modality GetModality() const override { return Modality::Text; }
    std::set<policy::RuleKind> SupportedKinds() const override;
    std::chrono::milliseconds Timeout() const override { return timeout_; }

    ScoreVector Score(const ContentItem& item, const std::set<policy::RuleKind>& kinds) const override;

    static double KeywordScore(const std::string& lowered, const std::vector<std::string>& keywords);
    static bool IsRepetitive(const std::string& text);
    static double CapsRatio(const std::string& text);

private:
    std::chrono::milliseconds timeout_;
    std::map<policy::RuleKind, std::vector<std::string>> keywords_;
};

} // namespace scoring
