#pragma once

#include "ContentItem.hpp"
#include "InputValidator.hpp"
#include "ModerationResult.hpp"
#include "RateLimiter.hpp"
#include "ResultCache.hpp"
#include "ThreatPatternDetector.hpp"
#include "policy/Policy.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct ChatGuardConfig;

namespace scoring {
class IFrameSampler;
class ModelRegistry;
class ScoreVector;
} // namespace scoring

struct HealthReport {
    std::string status;
    std::size_t cacheSize = 0;
    double degradedRequestRate = 0.0;
    uint64_t messagesChecked = 0;
    uint64_t violationsFound = 0;
    uint64_t actionsTaken = 0;
    uint64_t throttledActions = 0;
    uint64_t rejectedRequests = 0;
};

struct ViolationRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string chatId;
    std::string sourceId;
    Modality modality = Modality::Text;
    policy::RuleKind kind = policy::RuleKind::None;
    double confidence = 0.0;
    policy::RuleAction action = policy::RuleAction::None;
    std::string reason;
};

// The moderation request pipeline:
//
//   validate -> cache lookup -> score (fan-out) -> aggregate -> rate check
//
// Every call returns a well-formed ModerationResult; per-request failures
// become result fields. Safe to call from several threads at once.
class ModerationService {
public:
    using ViolationListener = std::function<void(const ViolationRecord&)>;

    static constexpr std::size_t MAX_RECENT_VIOLATIONS = 100;

    ModerationService(const ChatGuardConfig& config, scoring::ModelRegistry& registry,
        scoring::IFrameSampler& frameSampler, RateLimiter::ClockFn clock = &RateLimiter::Clock::now);

    ModerationResult Moderate(const ContentItem& item);

    // Swaps the active policy and clears the result cache. In-flight
    // requests finish against the policy they started with.
    void InstallPolicy(std::shared_ptr<const policy::Policy> policy);
    std::shared_ptr<const policy::Policy> ActivePolicy() const;

    HealthReport Health() const;

    std::vector<ViolationRecord> RecentViolations() const;
    void SetViolationListener(ViolationListener listener);

    std::vector<ThreatPattern> CheckThreatPatterns(const std::string& chatId) const;

    const InputValidator& Validator() const { return validator_; }

private:
    ModerationResult Score(const ContentItem& item, const policy::Policy& policy);
    // Applies the sender's rate budget and records the outcome.
    ModerationResult Finish(const ContentItem& item, ModerationResult result);
    void Aggregate(const ContentItem& item, const policy::Policy& policy, const scoring::ScoreVector& scores,
        ModerationResult& result);
    void ApplyRateLimit(const ContentItem& item, ModerationResult& result);
    void RecordViolation(const ContentItem& item, const ModerationResult& result);
    void RecordOutcome(const ModerationResult& result);

    static std::string CacheKey(const ContentItem& item);

    const ChatGuardConfig& config_;
    scoring::ModelRegistry& registry_;
    scoring::IFrameSampler& frameSampler_;

    InputValidator validator_;
    ResultCache cache_;
    RateLimiter rateLimiter_;
    ThreatPatternDetector threatDetector_;

    std::shared_ptr<const policy::Policy> policy_;

    std::atomic<uint64_t> messagesChecked_{0};
    std::atomic<uint64_t> violationsFound_{0};
    std::atomic<uint64_t> actionsTaken_{0};
    std::atomic<uint64_t> throttledActions_{0};
    std::atomic<uint64_t> rejectedRequests_{0};
    std::atomic<uint64_t> degradedRequests_{0};

    mutable std::mutex violationMutex_;
    std::deque<ViolationRecord> recentViolations_;
    ViolationListener violationListener_;
};
