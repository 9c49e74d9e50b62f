#include "scoring/KeywordTextScorer.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace scoring {

namespace {
constexpr double BASE_MATCH_SCORE = 0.6;
constexpr double MATCH_SHARE_WEIGHT = 0.35;
constexpr double MAX_KEYWORD_SCORE = 0.95;
constexpr double REPETITION_BONUS = 0.3;
constexpr std::size_t MIN_CAPS_LENGTH = 10;

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}
} // namespace

KeywordTextScorer::KeywordTextScorer(std::chrono::milliseconds timeout)
    : timeout_{timeout}
    , keywords_{
          {policy::RuleKind::Spam,
              {"buy now", "limited time", "click here", "free money", "earn $$$", "make money fast",
                  "work from home", "get rich quick", "no experience", "guaranteed income", "join now", "act now",
                  "special offer"}},
          {policy::RuleKind::Harassment,
              {"idiot", "stupid", "loser", "shut up", "kill yourself", "hate you", "worthless", "pathetic",
                  "disgusting", "go die"}},
          {policy::RuleKind::Nsfw,
              {"xxx", "porn", "naked", "nude", "sex chat", "adult content", "18+", "nsfw", "explicit"}},
          {policy::RuleKind::HateSpeech, {"terrorist", "nazi", "fascist"}},
          {policy::RuleKind::Violence, {"blood", "gore", "violence", "weapon", "fight", "kill", "shoot"}},
      } {}

std::set<policy::RuleKind> KeywordTextScorer::SupportedKinds() const {
    std::set<policy::RuleKind> kinds;
    for (const auto& entry : keywords_) {
        kinds.insert(entry.first);
    }
    kinds.insert(policy::RuleKind::Caps);
    return kinds;
}

ScoreVector KeywordTextScorer::Score(const ContentItem& item, const std::set<policy::RuleKind>& kinds) const {
    ScoreVector scores;
    const auto lowered = ToLower(item.payload);

    for (const auto& entry : keywords_) {
        if (kinds.count(entry.first) == 0) {
            continue;
        }

        auto score = KeywordScore(lowered, entry.second);
        if (entry.first == policy::RuleKind::Spam && score > 0.0 && IsRepetitive(item.payload)) {
            score = std::min(MAX_KEYWORD_SCORE, score + REPETITION_BONUS);
        }
        scores.Set(entry.first, score);
    }

    if (kinds.count(policy::RuleKind::Caps) > 0) {
        scores.Set(policy::RuleKind::Caps, CapsRatio(item.payload));
    }

    return scores;
}

double KeywordTextScorer::KeywordScore(const std::string& lowered, const std::vector<std::string>& keywords) {
    if (keywords.empty()) {
        return 0.0;
    }

    const auto matches = std::count_if(keywords.begin(), keywords.end(),
        [&lowered](const std::string& keyword) { return lowered.find(keyword) != std::string::npos; });
    if (matches == 0) {
        return 0.0;
    }

    const auto share = static_cast<double>(matches) / static_cast<double>(keywords.size());
    return std::min(MAX_KEYWORD_SCORE, BASE_MATCH_SCORE + share * MATCH_SHARE_WEIGHT);
}

bool KeywordTextScorer::IsRepetitive(const std::string& text) {
    std::istringstream in{ToLower(text)};
    std::unordered_map<std::string, std::size_t> counts;
    std::size_t total = 0;
    std::size_t highest = 0;

    std::string word;
    while (in >> word) {
        ++total;
        highest = std::max(highest, ++counts[word]);
    }

    return total >= 3 && static_cast<double>(highest) > static_cast<double>(total) * 0.5;
}

double KeywordTextScorer::CapsRatio(const std::string& text) {
    if (text.size() < MIN_CAPS_LENGTH) {
        return 0.0;
    }

    const auto upper = std::count_if(text.begin(), text.end(),
        [](unsigned char c) { return std::isupper(c) != 0; });
    return static_cast<double>(upper) / static_cast<double>(text.size());
}

} // namespace scoring
