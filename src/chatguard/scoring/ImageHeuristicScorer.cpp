#include "scoring/ImageHeuristicScorer.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace scoring {

namespace {
// YCrCb skin-tone range; luma is unconstrained.
const cv::Scalar SKIN_LOWER{0, 133, 77};
const cv::Scalar SKIN_UPPER{255, 173, 127};

// Below this share an image is treated as clean; the score then rises
// linearly and saturates at 0.95.
constexpr double SKIN_FLOOR = 0.15;
constexpr double SKIN_SPAN = 0.5;
constexpr double MAX_SCORE = 0.95;
} // namespace

ImageHeuristicScorer::ImageHeuristicScorer(std::chrono::milliseconds timeout, int analysisDimension)
    : timeout_{timeout}
    , analysisDimension_{std::max(analysisDimension, 16)} {}

ScoreVector ImageHeuristicScorer::Score(const ContentItem& item, const std::set<policy::RuleKind>& kinds) const {
    ScoreVector scores;
    if (kinds.count(policy::RuleKind::Nsfw) == 0) {
        return scores;
    }

    const auto ratio = SkinRatio(item.payload);
    const auto score = ratio <= SKIN_FLOOR ? 0.0 : std::min(MAX_SCORE, (ratio - SKIN_FLOOR) / SKIN_SPAN);
    scores.Set(policy::RuleKind::Nsfw, score);

    return scores;
}

double ImageHeuristicScorer::SkinRatio(const std::string& encodedImage) const {
    if (encodedImage.empty()) {
        throw ScorerFault("empty image");
    }

    cv::Mat buffer(1, static_cast<int>(encodedImage.size()), CV_8UC1,
        const_cast<char*>(encodedImage.data()));
    cv::Mat image = cv::imdecode(buffer, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw ScorerFault("image could not be decoded");
    }

    const auto longest = std::max(image.cols, image.rows);
    if (longest > analysisDimension_) {
        const double scale = static_cast<double>(analysisDimension_) / longest;
        cv::Mat resized;
        cv::resize(image, resized, cv::Size(), scale, scale, cv::INTER_AREA);
        image = resized;
    }

    cv::Mat ycrcb;
    cv::cvtColor(image, ycrcb, cv::COLOR_BGR2YCrCb);

    cv::Mat mask;
    cv::inRange(ycrcb, SKIN_LOWER, SKIN_UPPER, mask);

    const auto total = static_cast<double>(mask.total());
    return total > 0 ? cv::countNonZero(mask) / total : 0.0;
}

} // namespace scoring
