#include "RateLimiter.hpp"

#include <algorithm>
#include <utility>

RateLimiter::RateLimiter(double messagesPerSecond, double burstSize, std::size_t maxTrackedSources, ClockFn clock)
    : rate_{messagesPerSecond}
    , burst_{burstSize}
    , maxTrackedSources_{std::max<std::size_t>(maxTrackedSources, 1)}
    , clock_{std::move(clock)} {}

bool RateLimiter::Allow(const std::string& sourceId) {
    const auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    auto iter = budgets_.find(sourceId);
    if (iter == budgets_.end()) {
        EvictIfNeeded(now);
        iter = budgets_.emplace(sourceId, Budget{burst_, now}).first;
    } else {
        Refill(iter->second, now);
    }

    auto& budget = iter->second;
    if (budget.tokens < 1.0) {
        return false;
    }

    budget.tokens -= 1.0;
    return true;
}

std::size_t RateLimiter::TrackedSources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budgets_.size();
}

void RateLimiter::Refill(Budget& budget, Clock::time_point now) const {
    if (now <= budget.lastRefill) {
        return;
    }

    const std::chrono::duration<double> elapsed = now - budget.lastRefill;
    budget.tokens = std::min(burst_, budget.tokens + elapsed.count() * rate_);
    budget.lastRefill = now;
}

void RateLimiter::EvictIfNeeded(Clock::time_point now) {
    if (budgets_.size() < maxTrackedSources_) {
        return;
    }

    // Sources whose bucket has refilled completely carry no state worth
    // keeping.
    for (auto iter = budgets_.begin(); iter != budgets_.end();) {
        const std::chrono::duration<double> idle = now - iter->second.lastRefill;
        if (iter->second.tokens + idle.count() * rate_ >= burst_) {
            iter = budgets_.erase(iter);
        } else {
            ++iter;
        }
    }

    while (budgets_.size() >= maxTrackedSources_) {
        auto oldest = std::min_element(budgets_.begin(), budgets_.end(),
            [](const auto& lhs, const auto& rhs) { return lhs.second.lastRefill < rhs.second.lastRefill; });
        budgets_.erase(oldest);
    }
}
