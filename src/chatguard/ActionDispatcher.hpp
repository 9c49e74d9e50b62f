#pragma once

#include "policy/Rule.hpp"

#include <mutex>
#include <ostream>
#include <string>

class PlatformCredential;

// An enforced action handed to the messaging platform.
struct EnforcementAction {
    std::string chatId;
    std::string sourceId;
    std::string contentHash;
    policy::RuleKind kind = policy::RuleKind::None;
    policy::RuleAction action = policy::RuleAction::None;
    double confidence = 0.0;
};

class IActionDispatcher {
public:
    virtual ~IActionDispatcher() = default;

    virtual void Dispatch(const EnforcementAction& action) = 0;
};

// Writes one ACTION line per enforced action, authenticated with an
// HMAC-SHA256 keyed by the platform credential:
//
//   ACTION <payload> sig=<hex>
class SignedActionDispatcher : public IActionDispatcher {
public:
    SignedActionDispatcher(const PlatformCredential& credential, std::ostream& out);

    void Dispatch(const EnforcementAction& action) override;

    static std::string Payload(const EnforcementAction& action);

private:
    const PlatformCredential& credential_;
    std::mutex mutex_;
    std::ostream& out_;
};
