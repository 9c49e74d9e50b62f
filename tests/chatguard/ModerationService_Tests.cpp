#include "catch.hpp"

#include "ChatGuardConfig.hpp"
#include "ModerationService.hpp"
#include "policy/PolicyLoader.hpp"
#include "scoring/FrameSampler.hpp"
#include "scoring/ModelRegistry.hpp"

#include <atomic>
#include <exception>
#include <map>
#include <thread>

using namespace scoring;
using policy::RuleAction;
using policy::RuleKind;

namespace {

class FakeScorer final : public IScorer {
public:
    FakeScorer(Modality modality, std::map<RuleKind, double> scores,
        std::chrono::milliseconds timeout = std::chrono::seconds(2))
        : modality_{modality}
        , scores_{std::move(scores)}
        , timeout_{timeout} {}

    std::string Name() const override { return "fake-" + std::string{ToString(modality_)}; }
    Modality GetModality() const override { return modality_; }
    std::chrono::milliseconds Timeout() const override { return timeout_; }

    std::set<RuleKind> SupportedKinds() const override {
        std::set<RuleKind> kinds;
        for (const auto& score : scores_) {
            kinds.insert(score.first);
        }
        return kinds;
    }

    ScoreVector Score(const ContentItem&, const std::set<RuleKind>& kinds) const override {
        ++calls;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        ScoreVector result;
        for (auto kind : kinds) {
            result.Set(kind, scores_.at(kind));
        }
        return result;
    }

    std::chrono::milliseconds delay{0};
    mutable std::atomic<int> calls{0};

private:
    Modality modality_;
    std::map<RuleKind, double> scores_;
    std::chrono::milliseconds timeout_;
};

// Thrown the way a codec library reports corrupt input: not a runtime_error.
class DecoderFault : public std::exception {
public:
    const char* what() const noexcept override { return "codec fault"; }
};

class FakeFrameSampler final : public IFrameSampler {
public:
    std::vector<std::string> Sample(const std::string&, std::size_t maxFrames) override {
        ++calls;
        if (fault) {
            throw DecoderFault{};
        }
        if (frames == 0) {
            throw EmptyVideoError("no frame could be decoded");
        }

        lastMaxFrames = maxFrames;
        std::vector<std::string> sampled;
        for (std::size_t i = 0; i < frames; ++i) {
            sampled.push_back("frame-" + std::to_string(i));
        }
        return sampled;
    }

    std::size_t frames = 3;
    bool fault = false;
    std::size_t lastMaxFrames = 0;
    int calls = 0;
};

std::shared_ptr<const policy::Policy> MakePolicy(const std::vector<policy::RuleRecord>& records) {
    policy::RuleParser parser;
    policy::PolicyLoader loader{parser};

    auto result = loader.FromRecords(records);
    REQUIRE(result.Ok());
    return result.policy;
}

ContentItem Text(const std::string& payload, const std::string& sourceId = "user-1") {
    ContentItem item;
    item.modality = Modality::Text;
    item.payload = payload;
    item.sourceId = sourceId;
    item.chatId = "chat-1";
    return item;
}

ContentItem Media(Modality modality, const std::string& payload, const std::string& caption = "") {
    ContentItem item;
    item.modality = modality;
    item.payload = payload;
    item.caption = caption;
    item.sourceId = "user-1";
    item.chatId = "chat-1";
    return item;
}

struct ServiceHarness {
    ServiceHarness() {
        config.workerThreads = 4;
        config.maxVideoFrames = 5;
    }

    ModerationService& Start() {
        service.reset(new ModerationService(config, registry, sampler, [this]() { return now; }));
        return *service;
    }

    std::shared_ptr<FakeScorer> AddScorer(Modality modality, std::map<RuleKind, double> scores,
        std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        auto scorer = std::make_shared<FakeScorer>(modality, std::move(scores), timeout);
        registry.Register(scorer);
        return scorer;
    }

    ChatGuardConfig config;
    ModelRegistry registry{4};
    FakeFrameSampler sampler;
    RateLimiter::Clock::time_point now = RateLimiter::Clock::time_point{} + std::chrono::hours(1);
    std::unique_ptr<ModerationService> service;
};

} // namespace

SCENARIO("a score at or above the rule threshold is a violation", "[moderation]") {
    ServiceHarness harness;
    harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.9}});
    auto& service = harness.Start();

    GIVEN("a spam rule with threshold 0.8") {
        service.InstallPolicy(MakePolicy({{"spam", 0.8, "delete", ""}}));

        THEN("the message is deleted as spam") {
            auto result = service.Moderate(Text("buy now"));
            REQUIRE(result.isViolation);
            REQUIRE(result.kind == RuleKind::Spam);
            REQUIRE(result.action == RuleAction::Delete);
            REQUIRE(result.confidence == Approx(0.9));
            REQUIRE_FALSE(result.cached);
            REQUIRE_FALSE(result.degraded);
            REQUIRE(result.contentHash.size() == 64);
        }
    }

    GIVEN("a spam rule with threshold 0.95") {
        service.InstallPolicy(MakePolicy({{"spam", 0.95, "delete", ""}}));

        THEN("the message passes") {
            auto result = service.Moderate(Text("buy now"));
            REQUIRE_FALSE(result.isViolation);
            REQUIRE(result.action == RuleAction::None);
            REQUIRE(result.kind == RuleKind::None);
        }
    }
}

SCENARIO("the highest scoring rule wins and ties go to the earlier rule", "[moderation]") {
    GIVEN("two rules scoring the same") {
        ServiceHarness harness;
        harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.9}, {RuleKind::Harassment, 0.9}});
        auto& service = harness.Start();
        service.InstallPolicy(MakePolicy({{"harassment", 0.5, "warn", ""}, {"spam", 0.5, "delete", ""}}));

        THEN("the rule declared first is applied") {
            auto result = service.Moderate(Text("you loser, buy now"));
            REQUIRE(result.kind == RuleKind::Harassment);
            REQUIRE(result.action == RuleAction::Warn);
        }
    }

    GIVEN("a later rule scoring higher") {
        ServiceHarness harness;
        harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.95}, {RuleKind::Harassment, 0.9}});
        auto& service = harness.Start();
        service.InstallPolicy(MakePolicy({{"harassment", 0.5, "warn", ""}, {"spam", 0.5, "delete", ""}}));

        THEN("the higher confidence wins") {
            auto result = service.Moderate(Text("you loser, buy now"));
            REQUIRE(result.kind == RuleKind::Spam);
            REQUIRE(result.confidence == Approx(0.95));
        }
    }
}

SCENARIO("identical content is answered from the cache", "[moderation][cache]") {
    ServiceHarness harness;
    auto scorer = harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.9}});
    auto& service = harness.Start();
    service.InstallPolicy(MakePolicy({{"spam", 0.8, "delete", ""}}));

    auto first = service.Moderate(Text("buy now"));
    auto second = service.Moderate(Text("buy now", "user-2"));

    REQUIRE(scorer->calls.load() == 1);
    REQUIRE_FALSE(first.cached);
    REQUIRE(second.cached);

    second.cached = false;
    REQUIRE(second == first);

    WHEN("a new policy is installed") {
        service.InstallPolicy(MakePolicy({{"spam", 0.5, "warn", ""}}));

        THEN("cached verdicts are not reused") {
            auto third = service.Moderate(Text("buy now"));
            REQUIRE_FALSE(third.cached);
            REQUIRE(third.action == RuleAction::Warn);
            REQUIRE(scorer->calls.load() == 2);
        }
    }
}

SCENARIO("invalid items are rejected before any scorer runs", "[moderation][validation]") {
    ServiceHarness harness;
    harness.config.maxTextBytes = 16;
    auto scorer = harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.9}});
    auto& service = harness.Start();
    service.InstallPolicy(MakePolicy({{"spam", 0.8, "delete", ""}}));

    auto result = service.Moderate(Text(std::string(17, 'x')));

    REQUIRE(result.rejected);
    REQUIRE(result.rejectionReason == "oversized");
    REQUIRE_FALSE(result.isViolation);
    REQUIRE(scorer->calls.load() == 0);
    REQUIRE(service.Health().rejectedRequests == 1);
}

SCENARIO("a timed out scorer degrades the result without hiding other violations", "[moderation][scoring]") {
    ServiceHarness harness;
    auto image = harness.AddScorer(Modality::Image, {{RuleKind::Nsfw, 0.99}}, std::chrono::milliseconds(20));
    image->delay = std::chrono::milliseconds(400);
    harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.9}});
    auto& service = harness.Start();
    service.InstallPolicy(MakePolicy({{"nsfw", 0.7, "delete", ""}, {"spam", 0.8, "delete", ""}}));

    WHEN("an image with a spam caption is moderated") {
        auto result = service.Moderate(Media(Modality::Image, "image-bytes", "buy now"));

        THEN("the caption violation is reported and the result is degraded") {
            REQUIRE(result.isViolation);
            REQUIRE(result.kind == RuleKind::Spam);
            REQUIRE(result.degraded);
        }
    }

    WHEN("an image without a caption is moderated") {
        auto result = service.Moderate(Media(Modality::Image, "image-bytes"));

        THEN("the unknown nsfw score does not count as a violation") {
            REQUIRE_FALSE(result.isViolation);
            REQUIRE(result.degraded);
            REQUIRE(service.Health().status == "degraded");
        }
    }
}

SCENARIO("videos are scored frame by frame", "[moderation][video]") {
    ServiceHarness harness;
    auto image = harness.AddScorer(Modality::Image, {{RuleKind::Nsfw, 0.8}});
    auto& service = harness.Start();
    service.InstallPolicy(MakePolicy({{"nsfw", 0.7, "delete", ""}}));

    WHEN("the sampler returns frames") {
        auto result = service.Moderate(Media(Modality::Video, "video-bytes"));

        THEN("every frame is scored and the worst frame decides") {
            REQUIRE(harness.sampler.lastMaxFrames == 5);
            REQUIRE(image->calls.load() == 3);
            REQUIRE(result.isViolation);
            REQUIRE(result.kind == RuleKind::Nsfw);
        }
    }

    WHEN("no frame can be decoded") {
        harness.sampler.frames = 0;
        auto result = service.Moderate(Media(Modality::Video, "broken-video"));

        THEN("the result is a degraded non-violation") {
            REQUIRE_FALSE(result.isViolation);
            REQUIRE(result.degraded);
            REQUIRE(result.reason.find("empty video") == 0);
            REQUIRE(image->calls.load() == 0);
        }
    }

    WHEN("the decoder fails with its own exception type") {
        harness.sampler.fault = true;
        ModerationResult result;
        REQUIRE_NOTHROW(result = service.Moderate(Media(Modality::Video, "corrupt-video")));

        THEN("the result is a degraded non-violation") {
            REQUIRE_FALSE(result.isViolation);
            REQUIRE(result.degraded);
            REQUIRE(result.reason == "scoring failed: codec fault");
            REQUIRE(service.Health().messagesChecked == 1);
        }
    }
}

SCENARIO("pattern and length rules are checked on the message text", "[moderation][policy]") {
    ServiceHarness harness;
    auto& service = harness.Start();

    policy::Rule lengthRule;
    lengthRule.kind = RuleKind::Custom;
    lengthRule.action = RuleAction::Warn;
    lengthRule.threshold = 0.5;
    lengthRule.maxLength = 10;

    auto patterns = MakePolicy({{"custom", 0.5, "delete", "bit\\.ly/"}});
    auto rules = patterns->Rules();
    rules.push_back(lengthRule);
    service.InstallPolicy(policy::Policy::Create(rules));

    REQUIRE(service.Moderate(Text("see bit.ly/x")).action == RuleAction::Delete);
    REQUIRE(service.Moderate(Text("this one is long")).action == RuleAction::Warn);
    REQUIRE(service.Moderate(Text("\xC3\xBC\xC3\xBC\xC3\xBC\xC3\xBC\xC3\xBC\xC3\xBC")).isViolation == false);

    auto clean = service.Moderate(Text("short"));
    REQUIRE_FALSE(clean.isViolation);
}

SCENARIO("enforced actions past the rate budget are downgraded to log", "[moderation][ratelimit]") {
    ServiceHarness harness;
    harness.config.rateMessagesPerSecond = 1.0;
    harness.config.rateBurstSize = 2.0;
    harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.9}});
    auto& service = harness.Start();
    service.InstallPolicy(MakePolicy({{"spam", 0.8, "delete", ""}}));

    REQUIRE(service.Moderate(Text("buy now 1")).action == RuleAction::Delete);
    REQUIRE(service.Moderate(Text("buy now 2")).action == RuleAction::Delete);

    auto throttled = service.Moderate(Text("buy now 3"));
    REQUIRE(throttled.isViolation);
    REQUIRE(throttled.throttled);
    REQUIRE(throttled.action == RuleAction::Log);

    auto other = service.Moderate(Text("buy now 4", "user-2"));
    REQUIRE(other.action == RuleAction::Delete);

    auto health = service.Health();
    REQUIRE(health.violationsFound == 4);
    REQUIRE(health.actionsTaken == 3);
    REQUIRE(health.throttledActions == 1);

    WHEN("time passes") {
        harness.now += std::chrono::seconds(1);

        THEN("the source may be enforced against again") {
            REQUIRE(service.Moderate(Text("buy now 5")).action == RuleAction::Delete);
        }
    }
}

SCENARIO("a cached verdict is rate limited for the sender asking", "[moderation][ratelimit][cache]") {
    ServiceHarness harness;
    harness.config.rateMessagesPerSecond = 1.0;
    harness.config.rateBurstSize = 1.0;
    auto scorer = harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.9}});
    auto& service = harness.Start();
    service.InstallPolicy(MakePolicy({{"spam", 0.8, "delete", ""}}));

    GIVEN("alice has spent the rate budget") {
        REQUIRE(service.Moderate(Text("first", "alice")).action == RuleAction::Delete);

        auto throttled = service.Moderate(Text("buy now", "alice"));
        REQUIRE(throttled.throttled);
        REQUIRE(throttled.action == RuleAction::Log);

        WHEN("bob sends the same content") {
            auto fresh = service.Moderate(Text("buy now", "bob"));

            THEN("the verdict comes from the cache with bob's own budget applied") {
                REQUIRE(fresh.cached);
                REQUIRE(fresh.action == RuleAction::Delete);
                REQUIRE_FALSE(fresh.throttled);
                REQUIRE(scorer->calls.load() == 2);
            }
        }

        WHEN("alice repeats the content") {
            auto again = service.Moderate(Text("buy now", "alice"));

            THEN("the cached verdict is still throttled for alice") {
                REQUIRE(again.cached);
                REQUIRE(again.throttled);
                REQUIRE(again.action == RuleAction::Log);
                REQUIRE(service.Health().throttledActions == 2);
            }
        }
    }
}

SCENARIO("without a policy nothing is a violation", "[moderation]") {
    ServiceHarness harness;
    auto scorer = harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.9}});
    auto& service = harness.Start();

    auto result = service.Moderate(Text("buy now"));

    REQUIRE_FALSE(result.isViolation);
    REQUIRE(result.reason == "no policy");
    REQUIRE(scorer->calls.load() == 0);
    REQUIRE(service.Health().status == "no_policy");
}

SCENARIO("health and the violation feed reflect what was moderated", "[moderation]") {
    ServiceHarness harness;
    harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.9}});
    auto& service = harness.Start();
    service.InstallPolicy(MakePolicy({{"spam", 0.8, "alert", ""}}));

    std::vector<ViolationRecord> delivered;
    service.SetViolationListener([&delivered](const ViolationRecord& record) { delivered.push_back(record); });

    service.Moderate(Text("buy now"));
    service.Moderate(Text("buy now"));

    auto health = service.Health();
    REQUIRE(health.status == "ok");
    REQUIRE(health.messagesChecked == 2);
    REQUIRE(health.violationsFound == 2);
    REQUIRE(health.cacheSize == 1);
    REQUIRE(health.degradedRequestRate == Approx(0.0));

    auto violations = service.RecentViolations();
    REQUIRE(violations.size() == 2);
    REQUIRE(violations[0].chatId == "chat-1");
    REQUIRE(violations[0].kind == RuleKind::Spam);
    REQUIRE(violations[0].action == RuleAction::Alert);
    REQUIRE(delivered.size() == 2);
}

SCENARIO("the violation feed keeps only the most recent entries", "[moderation]") {
    ServiceHarness harness;
    harness.AddScorer(Modality::Text, {{RuleKind::Spam, 0.9}});
    auto& service = harness.Start();
    service.InstallPolicy(MakePolicy({{"spam", 0.8, "log", ""}}));

    for (std::size_t i = 0; i < ModerationService::MAX_RECENT_VIOLATIONS + 5; ++i) {
        service.Moderate(Text("buy now " + std::to_string(i)));
    }

    REQUIRE(service.RecentViolations().size() == ModerationService::MAX_RECENT_VIOLATIONS);
}

SCENARIO("moderated text feeds chat-level threat detection", "[moderation][threats]") {
    ServiceHarness harness;
    auto& service = harness.Start();
    service.InstallPolicy(MakePolicy({{"spam", 0.8, "delete", ""}}));

    service.Moderate(Text("join my channel for free crypto", "alice"));
    service.Moderate(Text("join my channel for free crypto", "bob"));
    service.Moderate(Text("join my channel for free crypto", "carol"));

    auto patterns = service.CheckThreatPatterns("chat-1");
    REQUIRE(patterns.size() == 1);
    REQUIRE(patterns[0].type == ThreatType::CoordinatedSpam);
}
