#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct ChatGuardConfig {
    ChatGuardConfig() = default;

    const uint32_t version = 1;

    // Result cache
    uint32_t cacheCapacity = 1000;

    // Rate limiting of enforced actions, per source
    double rateMessagesPerSecond = 10.0;
    double rateBurstSize = 20.0;
    uint32_t rateMaxTrackedSources = 10000;

    // Scoring
    uint32_t workerThreads = 4;
    uint32_t textScorerTimeoutMs = 2000;
    uint32_t imageScorerTimeoutMs = 5000;
    uint32_t maxVideoFrames = 8;

    // Input validation
    uint32_t maxTextBytes = 4 * 1024;
    uint32_t maxImageBytes = 10 * 1024 * 1024;
    uint32_t maxVideoBytes = 50 * 1024 * 1024;
    bool rejectMalformedText = false;
    std::vector<std::string> allowedChats;
    std::string mediaRoot = "var/chatguard/media";
    std::string scratchDirectory = "var/chatguard/scratch";

    // Policy
    std::string policyFile;
    std::vector<std::string> policyRules;
    double defaultRuleThreshold = 0.8;

    // Secrets. The plaintext credential only lives here until it has been
    // sealed at startup.
    std::string masterKeyPath = "var/chatguard/master.key";
    std::string secretStorePath = "var/chatguard/secrets.db";
    std::string platformCredential;

    double degradedStatusThreshold = 0.25;
    uint32_t threatWindowMinutes = 5;

    std::string loggerConfig;
};
