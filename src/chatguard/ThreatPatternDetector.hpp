#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

enum class ThreatType {
    CoordinatedSpam,
    Raid,
    LinkFarming,
};

inline const char* ToString(ThreatType type) {
    switch (type) {
    case ThreatType::CoordinatedSpam:
        return "coordinated_spam";
    case ThreatType::Raid:
        return "raid";
    case ThreatType::LinkFarming:
        return "link_farming";
    }

    return "unknown";
}

struct ThreatPattern {
    ThreatType type = ThreatType::CoordinatedSpam;
    double confidence = 0.0;
    std::vector<std::string> affectedUsers;
    std::chrono::minutes window{0};
    std::string evidence;
    std::string recommendedAction;
};

// Chat-level abuse detection over recently tracked text messages: several
// accounts posting near-identical text, floods from fresh accounts, and
// many messages pushing the same few links.
//
// Only word sets and link tokens are kept, never the message itself. Chat
// history is trimmed to the window and per-user activity to
// USER_HISTORY_HORIZON; the number of chats and users tracked is capped.
class ThreatPatternDetector {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    static constexpr std::size_t MAX_MESSAGES_PER_CHAT = 1000;
    static constexpr std::size_t MAX_MESSAGES_PER_USER = 100;
    static constexpr std::size_t MAX_TRACKED_CHATS = 1000;
    static constexpr std::size_t MAX_TRACKED_USERS = 10000;
    static constexpr std::chrono::hours USER_HISTORY_HORIZON{24};

    explicit ThreatPatternDetector(std::chrono::minutes window = std::chrono::minutes(5), ClockFn clock = &Clock::now,
        std::size_t maxTrackedChats = MAX_TRACKED_CHATS, std::size_t maxTrackedUsers = MAX_TRACKED_USERS);

    void Track(const std::string& userId, const std::string& chatId, const std::string& message);

    std::size_t TrackedChats() const;
    std::size_t TrackedUsers() const;

    std::vector<ThreatPattern> Detect(const std::string& chatId) const;

    // Jaccard similarity of the lower-cased word sets.
    static double Similarity(const std::string& lhs, const std::string& rhs);

    static std::string RecommendedAction(ThreatType type);

private:
    struct TrackedMessage {
        std::string userId;
        std::set<std::string> words;
        std::string groupKey;
        std::vector<std::string> links;
        Clock::time_point at;
    };

    std::vector<const TrackedMessage*> Recent(const std::deque<TrackedMessage>& history,
        Clock::time_point since) const;

    bool DetectCoordinatedSpam(const std::deque<TrackedMessage>& history, Clock::time_point now,
        ThreatPattern& pattern) const;
    bool DetectRaid(const std::deque<TrackedMessage>& history, Clock::time_point now, ThreatPattern& pattern) const;
    bool DetectLinkFarming(const std::deque<TrackedMessage>& history, Clock::time_point now,
        ThreatPattern& pattern) const;

    void EvictChatIfNeeded(Clock::time_point now);
    void EvictUserIfNeeded(Clock::time_point now);

    const std::chrono::minutes window_;
    ClockFn clock_;
    const std::size_t maxTrackedChats_;
    const std::size_t maxTrackedUsers_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<TrackedMessage>> chats_;
    std::unordered_map<std::string, std::deque<Clock::time_point>> userHistory_;
};
