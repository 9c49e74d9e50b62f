#include "catch.hpp"

#include "ThreatPatternDetector.hpp"

#include <algorithm>

namespace {

bool Has(const std::vector<ThreatPattern>& patterns, ThreatType type) {
    return std::any_of(patterns.begin(), patterns.end(),
        [type](const ThreatPattern& pattern) { return pattern.type == type; });
}

} // namespace

SCENARIO("several accounts posting the same text is coordinated spam", "[threats]") {
    auto now = ThreatPatternDetector::Clock::time_point{} + std::chrono::hours(1);
    ThreatPatternDetector detector{std::chrono::minutes(5), [&now]() { return now; }};

    GIVEN("three users sending the same message") {
        detector.Track("alice", "chat-1", "Buy cheap followers now");
        detector.Track("bob", "chat-1", "buy cheap followers NOW");
        detector.Track("carol", "chat-1", "Buy cheap followers now");

        THEN("coordinated spam is reported with every account involved") {
            auto patterns = detector.Detect("chat-1");
            REQUIRE(patterns.size() == 1);
            REQUIRE(patterns[0].type == ThreatType::CoordinatedSpam);
            REQUIRE(patterns[0].confidence == Approx(0.85));
            REQUIRE(patterns[0].affectedUsers == std::vector<std::string>{"alice", "bob", "carol"});
            REQUIRE(patterns[0].recommendedAction == "ban_users");
        }

        THEN("other chats are not affected") {
            REQUIRE(detector.Detect("chat-2").empty());
        }

        WHEN("the detection window has passed") {
            now += std::chrono::minutes(6);

            THEN("nothing is reported") {
                REQUIRE(detector.Detect("chat-1").empty());
            }
        }
    }

    GIVEN("only two users sending the same message") {
        detector.Track("alice", "chat-1", "Buy cheap followers now");
        detector.Track("bob", "chat-1", "Buy cheap followers now");
        detector.Track("alice", "chat-1", "Buy cheap followers now");

        THEN("it is not coordinated spam") {
            REQUIRE_FALSE(Has(detector.Detect("chat-1"), ThreatType::CoordinatedSpam));
        }
    }
}

SCENARIO("a burst of messages from fresh accounts is a raid", "[threats]") {
    auto now = ThreatPatternDetector::Clock::time_point{} + std::chrono::hours(1);
    ThreatPatternDetector detector{std::chrono::minutes(5), [&now]() { return now; }};

    for (int user = 0; user < 13; ++user) {
        for (int message = 0; message < 4; ++message) {
            detector.Track("raider-" + std::to_string(user), "chat-1",
                "msg-" + std::to_string(user) + "-" + std::to_string(message) + " alpha");
        }
    }

    auto patterns = detector.Detect("chat-1");

    REQUIRE(patterns.size() == 1);
    REQUIRE(patterns[0].type == ThreatType::Raid);
    REQUIRE(patterns[0].affectedUsers.size() == 13);
    REQUIRE(patterns[0].window == std::chrono::minutes(1));
    REQUIRE(patterns[0].recommendedAction == "enable_slow_mode");
}

SCENARIO("established accounts chatting quickly are not a raid", "[threats]") {
    auto now = ThreatPatternDetector::Clock::time_point{} + std::chrono::hours(1);
    ThreatPatternDetector detector{std::chrono::minutes(5), [&now]() { return now; }};

    for (int user = 0; user < 13; ++user) {
        for (int message = 0; message < 5; ++message) {
            detector.Track("regular-" + std::to_string(user), "chat-1",
                "msg-" + std::to_string(user) + "-" + std::to_string(message) + " alpha");
        }
    }

    REQUIRE_FALSE(Has(detector.Detect("chat-1"), ThreatType::Raid));
}

SCENARIO("many messages pushing the same link are link farming", "[threats]") {
    auto now = ThreatPatternDetector::Clock::time_point{} + std::chrono::hours(1);
    ThreatPatternDetector detector{std::chrono::minutes(5), [&now]() { return now; }};

    for (int i = 0; i < 12; ++i) {
        detector.Track("user-" + std::to_string(i % 3), "chat-1",
            "check " + std::to_string(i) + " https://spam.example/x");
    }

    auto patterns = detector.Detect("chat-1");

    REQUIRE(patterns.size() == 1);
    REQUIRE(patterns[0].type == ThreatType::LinkFarming);
    REQUIRE(patterns[0].affectedUsers.size() == 3);
    REQUIRE(patterns[0].recommendedAction == "restrict_links");
}

SCENARIO("many different links are not link farming", "[threats]") {
    auto now = ThreatPatternDetector::Clock::time_point{} + std::chrono::hours(1);
    ThreatPatternDetector detector{std::chrono::minutes(5), [&now]() { return now; }};

    for (int i = 0; i < 12; ++i) {
        detector.Track("user-" + std::to_string(i % 3), "chat-1",
            "see https://site" + std::to_string(i) + ".example/page");
    }

    REQUIRE_FALSE(Has(detector.Detect("chat-1"), ThreatType::LinkFarming));
}

SCENARIO("message similarity is the overlap of word sets", "[threats]") {
    REQUIRE(ThreatPatternDetector::Similarity("Hello World", "hello world") == Approx(1.0));
    REQUIRE(ThreatPatternDetector::Similarity("hello world", "hello there") == Approx(1.0 / 3.0));
    REQUIRE(ThreatPatternDetector::Similarity("", "hello") == Approx(0.0));
}

SCENARIO("the number of tracked chats and users stays bounded", "[threats]") {
    auto now = ThreatPatternDetector::Clock::time_point{} + std::chrono::hours(1);
    ThreatPatternDetector detector{std::chrono::minutes(5), [&now]() { return now; }, 2, 3};

    for (int i = 0; i < 50; ++i) {
        detector.Track("user-" + std::to_string(i), "chat-" + std::to_string(i), "hello there");
        now += std::chrono::seconds(1);
    }

    REQUIRE(detector.TrackedUsers() == 3);
    REQUIRE(detector.TrackedChats() == 2);

    WHEN("a new chat is flooded after the churn") {
        detector.Track("alice", "chat-live", "Buy cheap followers now");
        detector.Track("bob", "chat-live", "Buy cheap followers now");
        detector.Track("carol", "chat-live", "Buy cheap followers now");

        THEN("detection still works within the bounds") {
            REQUIRE(Has(detector.Detect("chat-live"), ThreatType::CoordinatedSpam));
            REQUIRE(detector.TrackedUsers() == 3);
            REQUIRE(detector.TrackedChats() == 2);
        }
    }
}

SCENARIO("chat history older than the window is dropped", "[threats]") {
    auto now = ThreatPatternDetector::Clock::time_point{} + std::chrono::hours(1);
    ThreatPatternDetector detector{std::chrono::minutes(5), [&now]() { return now; }, 2, 100};

    detector.Track("alice", "chat-1", "good morning");
    detector.Track("bob", "chat-2", "good morning");

    now += std::chrono::minutes(6);
    detector.Track("carol", "chat-3", "good morning");

    THEN("expired chats make room before active ones are evicted") {
        REQUIRE(detector.TrackedChats() == 1);
        REQUIRE(detector.Detect("chat-1").empty());
        REQUIRE(detector.TrackedUsers() == 3);
    }
}
