#include "ActionDispatcher.hpp"

#include "Digest.hpp"
#include "SecretManager.hpp"

#include "easylogging++.h"

#include <iomanip>
#include <sstream>

SignedActionDispatcher::SignedActionDispatcher(const PlatformCredential& credential, std::ostream& out)
    : credential_{credential}
    , out_{out} {}

void SignedActionDispatcher::Dispatch(const EnforcementAction& action) {
    const auto payload = Payload(action);
    const auto signature = credential_.WithPlaintext(
        [&payload](const std::string& secret) { return HmacSha256Hex(secret, payload); });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "ACTION " << payload << " sig=" << signature << std::endl;
    }

    LOG(INFO) << "Dispatched " << policy::ToString(action.action) << " for " << action.sourceId << " in "
              << action.chatId;
}

std::string SignedActionDispatcher::Payload(const EnforcementAction& action) {
    std::ostringstream out;
    out << policy::ToString(action.action) << " chat=" << action.chatId << " source=" << action.sourceId
        << " kind=" << policy::ToString(action.kind) << " confidence=" << std::fixed << std::setprecision(2)
        << action.confidence << " hash=" << action.contentHash;
    return out.str();
}
