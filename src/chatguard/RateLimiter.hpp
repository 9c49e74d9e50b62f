#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

// Per-source token bucket. Tokens are refilled lazily from the time elapsed
// since the bucket was last touched; nothing runs in the background.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    RateLimiter(double messagesPerSecond, double burstSize, std::size_t maxTrackedSources,
        ClockFn clock = &Clock::now);

    // Consumes one token when available. Never blocks.
    bool Allow(const std::string& sourceId);

    std::size_t TrackedSources() const;

private:
    struct Budget {
        double tokens;
        Clock::time_point lastRefill;
    };

    void Refill(Budget& budget, Clock::time_point now) const;
    void EvictIfNeeded(Clock::time_point now);

    const double rate_;
    const double burst_;
    const std::size_t maxTrackedSources_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Budget> budgets_;
};
