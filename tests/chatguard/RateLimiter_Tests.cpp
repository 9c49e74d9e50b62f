#include "catch.hpp"

#include "RateLimiter.hpp"

SCENARIO("a source may burst and then refills at the configured rate", "[ratelimit]") {
    auto now = RateLimiter::Clock::time_point{};
    RateLimiter limiter{10.0, 20.0, 100, [&now]() { return now; }};

    GIVEN("a source that has spent its burst") {
        int allowed = 0;
        for (int i = 0; i < 20; ++i) {
            allowed += limiter.Allow("user-1") ? 1 : 0;
        }
        REQUIRE(allowed == 20);

        THEN("the next action is denied") {
            REQUIRE_FALSE(limiter.Allow("user-1"));
        }

        WHEN("one second passes") {
            now += std::chrono::seconds(1);

            THEN("exactly ten more actions are allowed") {
                int refilled = 0;
                while (refilled < 100 && limiter.Allow("user-1")) {
                    ++refilled;
                }
                REQUIRE(refilled == 10);
            }
        }

        WHEN("a long time passes") {
            now += std::chrono::hours(1);

            THEN("the bucket holds no more than the burst") {
                int refilled = 0;
                while (refilled < 100 && limiter.Allow("user-1")) {
                    ++refilled;
                }
                REQUIRE(refilled == 20);
            }
        }

        THEN("other sources keep their own budget") {
            REQUIRE(limiter.Allow("user-2"));
        }
    }
}

SCENARIO("the number of tracked sources is bounded", "[ratelimit]") {
    auto now = RateLimiter::Clock::time_point{};
    RateLimiter limiter{1.0, 5.0, 2, [&now]() { return now; }};

    REQUIRE(limiter.Allow("a"));
    now += std::chrono::milliseconds(10);
    REQUIRE(limiter.Allow("b"));
    now += std::chrono::milliseconds(10);
    REQUIRE(limiter.Allow("c"));

    REQUIRE(limiter.TrackedSources() == 2);
}

SCENARIO("sources whose bucket refilled are forgotten first", "[ratelimit]") {
    auto now = RateLimiter::Clock::time_point{};
    RateLimiter limiter{1.0, 2.0, 2, [&now]() { return now; }};

    REQUIRE(limiter.Allow("a"));
    REQUIRE(limiter.Allow("b"));
    REQUIRE(limiter.Allow("b"));

    now += std::chrono::seconds(1);
    REQUIRE(limiter.Allow("c"));

    // "a" refilled to the burst and was dropped; "b" still owes a token.
    REQUIRE(limiter.TrackedSources() == 2);
    REQUIRE(limiter.Allow("b"));
    REQUIRE_FALSE(limiter.Allow("b"));
}
