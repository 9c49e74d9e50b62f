#include "ModerationService.hpp"

#include "ChatGuardConfig.hpp"
#include "Digest.hpp"
#include "scoring/FrameSampler.hpp"
#include "scoring/ModelRegistry.hpp"

#include "easylogging++.h"

#include <algorithm>
#include <iomanip>
#include <regex>
#include <sstream>

constexpr std::size_t ModerationService::MAX_RECENT_VIOLATIONS;

namespace {
std::chrono::microseconds Elapsed(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
}

std::size_t CodePointCount(const std::string& text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(),
        [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

// Pattern and length rules are checked locally against the message text and
// score 1.0 when they match.
double LocalRuleScore(const policy::Rule& rule, const std::vector<const std::string*>& texts) {
    for (const auto* text : texts) {
        if (rule.HasPattern() && std::regex_search(*text, *rule.pattern)) {
            return 1.0;
        }
        if (rule.HasLengthLimit() && CodePointCount(*text) > rule.maxLength) {
            return 1.0;
        }
    }

    return 0.0;
}

std::string DescribeMatch(const policy::Rule& rule, double confidence) {
    std::ostringstream out;
    out << policy::ToString(rule.kind) << " " << std::fixed << std::setprecision(2) << confidence
        << " >= " << rule.threshold;
    if (!rule.source.empty()) {
        out << " (rule: " << rule.source << ")";
    }
    return out.str();
}
} // namespace

ModerationService::ModerationService(const ChatGuardConfig& config, scoring::ModelRegistry& registry,
    scoring::IFrameSampler& frameSampler, RateLimiter::ClockFn clock)
    : config_{config}
    , registry_{registry}
    , frameSampler_{frameSampler}
    , validator_{config}
    , cache_{config.cacheCapacity}
    , rateLimiter_{config.rateMessagesPerSecond, config.rateBurstSize, config.rateMaxTrackedSources, clock}
    , threatDetector_{std::chrono::minutes(config.threatWindowMinutes), clock} {}

ModerationResult ModerationService::Moderate(const ContentItem& item) {
    const auto started = std::chrono::steady_clock::now();
    ++messagesChecked_;

    ContentItem sanitized;
    try {
        sanitized = validator_.Validate(item);
    } catch (const ValidationError& e) {
        ++rejectedRequests_;
        LOG(INFO) << "Rejected " << ToString(item.modality) << " from " << item.sourceId << " in " << item.chatId
                  << ": " << e.what();

        ModerationResult result;
        result.rejected = true;
        result.rejectionReason = ToString(e.Failure());
        result.reason = e.what();
        result.latency = Elapsed(started);
        return result;
    }

    sanitized.contentHash = Sha256Hex(sanitized.payload);
    if (sanitized.modality == Modality::Text) {
        threatDetector_.Track(sanitized.sourceId, sanitized.chatId, sanitized.payload);
    }

    const auto policy = ActivePolicy();
    if (!policy) {
        ModerationResult result;
        result.reason = "no policy";
        result.contentHash = sanitized.contentHash;
        result.latency = Elapsed(started);
        return result;
    }

    // The cache holds verdicts as scored. The rate budget belongs to the
    // sender and is applied to every answer, cached or not.
    const auto key = CacheKey(sanitized);
    if (auto cached = cache_.Get(key)) {
        cached->cached = true;
        return Finish(sanitized, *cached);
    }

    ModerationResult result;
    try {
        result = Score(sanitized, *policy);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Scoring " << ToString(sanitized.modality) << " from " << sanitized.sourceId
                   << " failed: " << e.what();

        result = ModerationResult{};
        result.degraded = true;
        result.reason = std::string{"scoring failed: "} + e.what();
        result.contentHash = sanitized.contentHash;
        result.latency = Elapsed(started);
        RecordOutcome(result);
        return result;
    }

    result.contentHash = sanitized.contentHash;
    result.latency = Elapsed(started);

    cache_.Put(key, result);
    return Finish(sanitized, result);
}

void ModerationService::InstallPolicy(std::shared_ptr<const policy::Policy> policy) {
    const auto size = policy ? policy->Size() : 0;

    std::atomic_store(&policy_, std::move(policy));
    cache_.Clear();

    LOG(INFO) << "Installed policy with " << size << " rules";
}

std::shared_ptr<const policy::Policy> ModerationService::ActivePolicy() const { return std::atomic_load(&policy_); }

HealthReport ModerationService::Health() const {
    HealthReport report;
    report.cacheSize = cache_.Size();
    report.messagesChecked = messagesChecked_.load();
    report.violationsFound = violationsFound_.load();
    report.actionsTaken = actionsTaken_.load();
    report.throttledActions = throttledActions_.load();
    report.rejectedRequests = rejectedRequests_.load();

    if (report.messagesChecked > 0) {
        report.degradedRequestRate =
            static_cast<double>(degradedRequests_.load()) / static_cast<double>(report.messagesChecked);
    }

    if (!ActivePolicy()) {
        report.status = "no_policy";
    } else if (report.degradedRequestRate > config_.degradedStatusThreshold) {
        report.status = "degraded";
    } else {
        report.status = "ok";
    }

    return report;
}

std::vector<ViolationRecord> ModerationService::RecentViolations() const {
    std::lock_guard<std::mutex> lock(violationMutex_);
    return std::vector<ViolationRecord>(recentViolations_.begin(), recentViolations_.end());
}

void ModerationService::SetViolationListener(ViolationListener listener) {
    std::lock_guard<std::mutex> lock(violationMutex_);
    violationListener_ = std::move(listener);
}

std::vector<ThreatPattern> ModerationService::CheckThreatPatterns(const std::string& chatId) const {
    return threatDetector_.Detect(chatId);
}

ModerationResult ModerationService::Score(const ContentItem& item, const policy::Policy& policy) {
    ModerationResult result;
    std::vector<ContentItem> units;

    if (item.modality == Modality::Video) {
        try {
            for (auto& frame : frameSampler_.Sample(item.payload, config_.maxVideoFrames)) {
                ContentItem unit;
                unit.modality = Modality::Image;
                unit.payload = std::move(frame);
                unit.sourceId = item.sourceId;
                unit.chatId = item.chatId;
                units.push_back(std::move(unit));
            }
        } catch (const scoring::EmptyVideoError& e) {
            LOG(WARNING) << "Video from " << item.sourceId << " has no usable frames: " << e.what();
            result.degraded = true;
            result.reason = std::string{"empty video: "} + e.what();
        }
    } else {
        units.push_back(item);
    }

    if (!item.caption.empty()) {
        ContentItem caption;
        caption.modality = Modality::Text;
        caption.payload = item.caption;
        caption.sourceId = item.sourceId;
        caption.chatId = item.chatId;
        units.push_back(std::move(caption));
    }

    scoring::ScoreVector scores;
    if (!units.empty()) {
        scores = registry_.Score(units, policy.Kinds());
    }

    Aggregate(item, policy, scores, result);
    result.degraded = result.degraded || scores.Degraded();

    return result;
}

ModerationResult ModerationService::Finish(const ContentItem& item, ModerationResult result) {
    if (result.isViolation) {
        ApplyRateLimit(item, result);
    }

    RecordOutcome(result);
    if (result.isViolation) {
        RecordViolation(item, result);
    }

    return result;
}

void ModerationService::Aggregate(const ContentItem& item, const policy::Policy& policy,
    const scoring::ScoreVector& scores, ModerationResult& result) {
    std::vector<const std::string*> texts;
    if (item.modality == Modality::Text) {
        texts.push_back(&item.payload);
    }
    if (!item.caption.empty()) {
        texts.push_back(&item.caption);
    }

    const policy::Rule* winner = nullptr;
    double winningConfidence = 0.0;

    for (const auto& rule : policy.Rules()) {
        const auto modelScore = scores.Get(rule.kind);
        const auto localScore = LocalRuleScore(rule, texts);
        if (!modelScore && localScore == 0.0) {
            continue;
        }

        const auto confidence = std::max(modelScore.value_or(0.0), localScore);
        if (confidence < rule.threshold) {
            continue;
        }

        // Strictly greater keeps the earlier rule on ties.
        if (winner == nullptr || confidence > winningConfidence) {
            winner = &rule;
            winningConfidence = confidence;
        }
    }

    if (winner == nullptr) {
        if (result.reason.empty()) {
            result.reason = scores.Degraded() ? "no rule matched (partial scores)" : "no rule matched";
        }
        return;
    }

    result.isViolation = true;
    result.kind = winner->kind;
    result.confidence = winningConfidence;
    result.action = winner->action;
    result.reason = DescribeMatch(*winner, winningConfidence);
}

void ModerationService::ApplyRateLimit(const ContentItem& item, ModerationResult& result) {
    if (!policy::IsActiveAction(result.action)) {
        return;
    }

    if (rateLimiter_.Allow(item.sourceId)) {
        return;
    }

    LOG(WARNING) << "Rate budget exhausted for " << item.sourceId << "; " << policy::ToString(result.action)
                 << " downgraded to log";

    ++throttledActions_;
    result.action = policy::RuleAction::Log;
    result.throttled = true;
}

void ModerationService::RecordViolation(const ContentItem& item, const ModerationResult& result) {
    ViolationRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.chatId = item.chatId;
    record.sourceId = item.sourceId;
    record.modality = item.modality;
    record.kind = result.kind;
    record.confidence = result.confidence;
    record.action = result.action;
    record.reason = result.reason;

    ViolationListener listener;
    {
        std::lock_guard<std::mutex> lock(violationMutex_);
        recentViolations_.push_back(record);
        if (recentViolations_.size() > MAX_RECENT_VIOLATIONS) {
            recentViolations_.pop_front();
        }
        listener = violationListener_;
    }

    LOG(INFO) << "Violation " << policy::ToString(record.kind) << " by " << record.sourceId << " in "
              << record.chatId << ": " << record.reason;

    if (listener) {
        listener(record);
    }
}

void ModerationService::RecordOutcome(const ModerationResult& result) {
    if (result.degraded) {
        ++degradedRequests_;
    }

    if (result.isViolation) {
        ++violationsFound_;
        if (policy::IsActiveAction(result.action) && !result.throttled) {
            ++actionsTaken_;
        }
    }
}

std::string ModerationService::CacheKey(const ContentItem& item) {
    auto key = std::string{ToString(item.modality)} + ":" + item.contentHash;
    if (!item.caption.empty()) {
        key += ":" + Sha256Hex(item.caption);
    }
    return key;
}
