#include "ThreatPatternDetector.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <regex>
#include <sstream>

constexpr std::size_t ThreatPatternDetector::MAX_MESSAGES_PER_CHAT;
constexpr std::size_t ThreatPatternDetector::MAX_MESSAGES_PER_USER;
constexpr std::size_t ThreatPatternDetector::MAX_TRACKED_CHATS;
constexpr std::size_t ThreatPatternDetector::MAX_TRACKED_USERS;
constexpr std::chrono::hours ThreatPatternDetector::USER_HISTORY_HORIZON;

namespace {
constexpr double SIMILARITY_THRESHOLD = 0.8;
constexpr std::size_t MIN_COORDINATED_USERS = 3;
constexpr double COORDINATED_SPAM_CONFIDENCE = 0.85;

constexpr std::size_t RAID_MESSAGE_COUNT = 50;
constexpr std::size_t RAID_NEW_USER_COUNT = 10;
constexpr std::size_t NEW_USER_MESSAGE_COUNT = 5;
constexpr double RAID_CONFIDENCE = 0.9;

constexpr std::size_t LINK_MESSAGE_COUNT = 10;
constexpr double LINK_FARMING_CONFIDENCE = 0.75;

const std::regex& LinkPattern() {
    static const std::regex pattern{R"((?:https?://|www\.|t\.me/)[^\s]+|@\w+)", std::regex::icase};
    return pattern;
}

constexpr std::size_t SAMPLE_LENGTH = 100;

std::string Lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> Links(const std::string& text) {
    std::vector<std::string> links;
    for (std::sregex_iterator match(text.begin(), text.end(), LinkPattern()), end; match != end; ++match) {
        links.push_back(Lowered(match->str()));
    }
    return links;
}

std::set<std::string> WordSet(const std::string& text) {
    std::istringstream in{Lowered(text)};
    return std::set<std::string>{std::istream_iterator<std::string>(in), std::istream_iterator<std::string>()};
}

std::string GroupKey(const std::set<std::string>& words) {
    std::string key;
    for (const auto& word : words) {
        if (!key.empty()) {
            key.push_back(' ');
        }
        key += word;
    }
    return key;
}

double Jaccard(const std::set<std::string>& lhs, const std::set<std::string>& rhs) {
    if (lhs.empty() || rhs.empty()) {
        return 0.0;
    }

    std::vector<std::string> common;
    std::set_intersection(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(common));

    const auto unionSize = lhs.size() + rhs.size() - common.size();
    return static_cast<double>(common.size()) / static_cast<double>(unionSize);
}
} // namespace

ThreatPatternDetector::ThreatPatternDetector(std::chrono::minutes window, ClockFn clock, std::size_t maxTrackedChats,
    std::size_t maxTrackedUsers)
    : window_{std::max(window, std::chrono::minutes(1))}
    , clock_{std::move(clock)}
    , maxTrackedChats_{std::max<std::size_t>(maxTrackedChats, 1)}
    , maxTrackedUsers_{std::max<std::size_t>(maxTrackedUsers, 1)} {}

void ThreatPatternDetector::Track(const std::string& userId, const std::string& chatId, const std::string& message) {
    TrackedMessage tracked;
    tracked.userId = userId;
    tracked.words = WordSet(message);
    tracked.groupKey = GroupKey(tracked.words);
    tracked.links = Links(message);
    tracked.at = clock_();

    const auto now = tracked.at;
    std::lock_guard<std::mutex> lock(mutex_);

    if (chats_.find(chatId) == chats_.end()) {
        EvictChatIfNeeded(now);
    }
    auto& history = chats_[chatId];
    history.push_back(std::move(tracked));
    while (history.size() > MAX_MESSAGES_PER_CHAT || history.front().at <= now - window_) {
        history.pop_front();
    }

    if (userHistory_.find(userId) == userHistory_.end()) {
        EvictUserIfNeeded(now);
    }
    auto& activity = userHistory_[userId];
    activity.push_back(now);
    while (activity.size() > MAX_MESSAGES_PER_USER || activity.front() <= now - USER_HISTORY_HORIZON) {
        activity.pop_front();
    }
}

std::size_t ThreatPatternDetector::TrackedChats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chats_.size();
}

std::size_t ThreatPatternDetector::TrackedUsers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return userHistory_.size();
}

// Makes room for one more chat: expired chats go first, then the chat
// whose latest message is oldest.
void ThreatPatternDetector::EvictChatIfNeeded(Clock::time_point now) {
    if (chats_.size() < maxTrackedChats_) {
        return;
    }

    for (auto iter = chats_.begin(); iter != chats_.end();) {
        if (iter->second.back().at <= now - window_) {
            iter = chats_.erase(iter);
        } else {
            ++iter;
        }
    }

    if (chats_.size() < maxTrackedChats_) {
        return;
    }

    auto oldest = std::min_element(chats_.begin(), chats_.end(),
        [](const std::pair<const std::string, std::deque<TrackedMessage>>& lhs,
            const std::pair<const std::string, std::deque<TrackedMessage>>& rhs) {
            return lhs.second.back().at < rhs.second.back().at;
        });
    chats_.erase(oldest);
}

// Same for users, by their latest activity.
void ThreatPatternDetector::EvictUserIfNeeded(Clock::time_point now) {
    if (userHistory_.size() < maxTrackedUsers_) {
        return;
    }

    for (auto iter = userHistory_.begin(); iter != userHistory_.end();) {
        if (iter->second.back() <= now - USER_HISTORY_HORIZON) {
            iter = userHistory_.erase(iter);
        } else {
            ++iter;
        }
    }

    if (userHistory_.size() < maxTrackedUsers_) {
        return;
    }

    auto oldest = std::min_element(userHistory_.begin(), userHistory_.end(),
        [](const std::pair<const std::string, std::deque<Clock::time_point>>& lhs,
            const std::pair<const std::string, std::deque<Clock::time_point>>& rhs) {
            return lhs.second.back() < rhs.second.back();
        });
    userHistory_.erase(oldest);
}

std::vector<ThreatPattern> ThreatPatternDetector::Detect(const std::string& chatId) const {
    std::vector<ThreatPattern> patterns;
    const auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    auto iter = chats_.find(chatId);
    if (iter == chats_.end()) {
        return patterns;
    }

    ThreatPattern pattern;
    if (DetectCoordinatedSpam(iter->second, now, pattern)) {
        patterns.push_back(pattern);
    }

    pattern = ThreatPattern{};
    if (DetectRaid(iter->second, now, pattern)) {
        patterns.push_back(pattern);
    }

    pattern = ThreatPattern{};
    if (DetectLinkFarming(iter->second, now, pattern)) {
        patterns.push_back(pattern);
    }

    return patterns;
}

double ThreatPatternDetector::Similarity(const std::string& lhs, const std::string& rhs) {
    if (lhs == rhs) {
        return 1.0;
    }

    return Jaccard(WordSet(lhs), WordSet(rhs));
}

std::string ThreatPatternDetector::RecommendedAction(ThreatType type) {
    switch (type) {
    case ThreatType::CoordinatedSpam:
        return "ban_users";
    case ThreatType::Raid:
        return "enable_slow_mode";
    case ThreatType::LinkFarming:
        return "restrict_links";
    }

    return "monitor";
}

std::vector<const ThreatPatternDetector::TrackedMessage*> ThreatPatternDetector::Recent(
    const std::deque<TrackedMessage>& history, Clock::time_point since) const {
    std::vector<const TrackedMessage*> recent;
    for (const auto& message : history) {
        if (message.at > since) {
            recent.push_back(&message);
        }
    }
    return recent;
}

bool ThreatPatternDetector::DetectCoordinatedSpam(const std::deque<TrackedMessage>& history, Clock::time_point now,
    ThreatPattern& pattern) const {
    const auto recent = Recent(history, now - window_);
    if (recent.size() < MIN_COORDINATED_USERS) {
        return false;
    }

    std::map<std::string, std::set<std::string>> usersByGroup;
    std::map<std::string, std::size_t> messagesByGroup;
    std::map<std::string, std::string> sampleByGroup;

    for (std::size_t i = 0; i < recent.size(); ++i) {
        for (std::size_t j = i + 1; j < recent.size(); ++j) {
            const auto& first = *recent[i];
            const auto& second = *recent[j];
            if (first.userId == second.userId) {
                continue;
            }

            const auto similarity = first.groupKey == second.groupKey ? 1.0 : Jaccard(first.words, second.words);
            if (similarity <= SIMILARITY_THRESHOLD) {
                continue;
            }

            auto& users = usersByGroup[first.groupKey];
            users.insert(first.userId);
            users.insert(second.userId);
            messagesByGroup[first.groupKey] += 2;
            sampleByGroup.emplace(first.groupKey, first.groupKey.substr(0, SAMPLE_LENGTH));
        }
    }

    for (const auto& group : usersByGroup) {
        if (group.second.size() < MIN_COORDINATED_USERS) {
            continue;
        }

        pattern.type = ThreatType::CoordinatedSpam;
        pattern.confidence = COORDINATED_SPAM_CONFIDENCE;
        pattern.affectedUsers.assign(group.second.begin(), group.second.end());
        pattern.window = window_;
        pattern.evidence = "message_count=" + std::to_string(messagesByGroup[group.first])
            + " unique_users=" + std::to_string(group.second.size()) + " sample=\""
            + sampleByGroup[group.first] + "\"";
        pattern.recommendedAction = RecommendedAction(pattern.type);
        return true;
    }

    return false;
}

bool ThreatPatternDetector::DetectRaid(const std::deque<TrackedMessage>& history, Clock::time_point now,
    ThreatPattern& pattern) const {
    const auto burst = Recent(history, now - std::chrono::minutes(1));
    if (burst.size() <= RAID_MESSAGE_COUNT) {
        return false;
    }

    std::set<std::string> users;
    for (const auto* message : burst) {
        users.insert(message->userId);
    }

    std::vector<std::string> newUsers;
    for (const auto& user : users) {
        auto activity = userHistory_.find(user);
        if (activity == userHistory_.end() || activity->second.size() < NEW_USER_MESSAGE_COUNT) {
            newUsers.push_back(user);
        }
    }

    if (newUsers.size() <= RAID_NEW_USER_COUNT) {
        return false;
    }

    pattern.type = ThreatType::Raid;
    pattern.confidence = RAID_CONFIDENCE;
    pattern.window = std::chrono::minutes(1);
    pattern.evidence = "message_count=" + std::to_string(burst.size()) + " new_users="
        + std::to_string(newUsers.size()) + " total_users=" + std::to_string(users.size());
    pattern.affectedUsers = std::move(newUsers);
    pattern.recommendedAction = RecommendedAction(pattern.type);
    return true;
}

bool ThreatPatternDetector::DetectLinkFarming(const std::deque<TrackedMessage>& history, Clock::time_point now,
    ThreatPattern& pattern) const {
    std::set<std::string> users;
    std::set<std::string> links;
    std::size_t linkMessages = 0;

    for (const auto* message : Recent(history, now - window_)) {
        links.insert(message->links.begin(), message->links.end());
        if (!message->links.empty()) {
            ++linkMessages;
            users.insert(message->userId);
        }
    }

    if (linkMessages <= LINK_MESSAGE_COUNT || static_cast<double>(links.size()) >= linkMessages / 2.0) {
        return false;
    }

    pattern.type = ThreatType::LinkFarming;
    pattern.confidence = LINK_FARMING_CONFIDENCE;
    pattern.affectedUsers.assign(users.begin(), users.end());
    pattern.window = window_;
    pattern.evidence = "link_count=" + std::to_string(linkMessages) + " unique_links="
        + std::to_string(links.size()) + " users_involved=" + std::to_string(users.size());
    pattern.recommendedAction = RecommendedAction(pattern.type);
    return true;
}
