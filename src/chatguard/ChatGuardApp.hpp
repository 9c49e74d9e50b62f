#pragma once

#include "ChatGuardConfig.hpp"
#include "ModerationService.hpp"
#include "policy/PolicyLoader.hpp"
#include "policy/RuleParser.hpp"
#include "scoring/ModelRegistry.hpp"

#include <memory>
#include <ostream>
#include <string>

class IActionDispatcher;
class IDatabaseConnection;
class PlatformCredential;
class SecretManager;
class SecretStore;

namespace scoring {
class IFrameSampler;
}

// Wires the engine together from configuration and serves line-oriented
// requests:
//
//   text <source> <chat> <message...>
//   image|video <source> <chat> <path> [caption...]
//   health | violations | patterns <chat> | reload | quit
class ChatGuardApp {
public:
    ChatGuardApp(ChatGuardConfig& config, std::ostream& out);
    ~ChatGuardApp();

    bool IsRunning() const { return running_; }

    void HandleLine(const std::string& line);

    // Rebuilds the policy from configuration. On any error the active
    // policy stays in place.
    bool ReloadPolicy();

    ModerationService& Service() { return *service_; }

    static std::string FormatResult(const ModerationResult& result);
    static std::string FormatHealth(const HealthReport& report);

private:
    void SetupSecrets();
    void HandleModeration(Modality modality, std::istream& args);
    void HandlePatterns(std::istream& args);
    void HandleViolations();

    ChatGuardConfig& config_;
    std::ostream& out_;

    std::unique_ptr<SecretManager> secretManager_;
    std::unique_ptr<IDatabaseConnection> db_;
    std::unique_ptr<SecretStore> secretStore_;
    std::unique_ptr<PlatformCredential> credential_;
    std::unique_ptr<IActionDispatcher> dispatcher_;

    policy::RuleParser parser_;
    policy::PolicyLoader loader_;
    scoring::ModelRegistry registry_;
    std::unique_ptr<scoring::IFrameSampler> frameSampler_;
    std::unique_ptr<ModerationService> service_;

    bool running_ = true;
};
