#include "catch.hpp"

#include "scoring/ImageHeuristicScorer.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

using namespace scoring;
using policy::RuleKind;

namespace {

ContentItem SolidImage(const cv::Scalar& bgr) {
    cv::Mat image(64, 64, CV_8UC3, bgr);
    std::vector<uchar> encoded;
    cv::imencode(".png", image, encoded);

    ContentItem item;
    item.modality = Modality::Image;
    item.payload.assign(encoded.begin(), encoded.end());
    return item;
}

} // namespace

SCENARIO("skin-toned images score high for nsfw", "[scoring][image]") {
    ImageHeuristicScorer scorer{std::chrono::milliseconds(500)};

    auto scores = scorer.Score(SolidImage(cv::Scalar(120, 160, 220)), {RuleKind::Nsfw});

    REQUIRE(*scores.Get(RuleKind::Nsfw) == Approx(0.95));
}

SCENARIO("images without skin tones score zero", "[scoring][image]") {
    ImageHeuristicScorer scorer{std::chrono::milliseconds(500)};

    auto item = SolidImage(cv::Scalar(255, 0, 0));

    REQUIRE(scorer.SkinRatio(item.payload) == Approx(0.0));
    REQUIRE(*scorer.Score(item, {RuleKind::Nsfw}).Get(RuleKind::Nsfw) == Approx(0.0));
}

SCENARIO("undecodable images are scorer faults", "[scoring][image]") {
    ImageHeuristicScorer scorer{std::chrono::milliseconds(500)};

    ContentItem item;
    item.modality = Modality::Image;
    item.payload = "not an image";

    REQUIRE_THROWS_AS(scorer.Score(item, {RuleKind::Nsfw}), ScorerFault);
}

SCENARIO("the image scorer ignores kinds it was not asked for", "[scoring][image]") {
    ImageHeuristicScorer scorer{std::chrono::milliseconds(500)};

    ContentItem item;
    item.modality = Modality::Image;
    item.payload = "not an image";

    REQUIRE(scorer.Score(item, {RuleKind::Spam}).Known().empty());
}
