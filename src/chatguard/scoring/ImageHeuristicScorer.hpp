#pragma once

#include "scoring/Scorer.hpp"

namespace scoring {

// Decodes the image and estimates nsfw from the share of skin-toned pixels
// (YCrCb range test on a downscaled copy). Undecodable input is a
// ScorerFault.
class ImageHeuristicScorer : public IScorer {
public:
    explicit ImageHeuristicScorer(std::chrono::milliseconds timeout, int analysisDimension = 256);

    std::string Name() const override { return "image-heuristic"; }
    Modality GetModality() const override { return Modality::Image; }
    std::set<policy::RuleKind> SupportedKinds() const override { return {policy::RuleKind::Nsfw}; }
    std::chrono::milliseconds Timeout() const override { return timeout_; }

    ScoreVector Score(const ContentItem& item, const std::set<policy::RuleKind>& kinds) const override;

    // Share of pixels in [0,1] that fall into the skin-tone range.
    double SkinRatio(const std::string& encodedImage) const;

private:
    std::chrono::milliseconds timeout_;
    int analysisDimension_;
};

} // namespace scoring
