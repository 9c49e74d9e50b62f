#include "LogRedactor.hpp"

#include "easylogging++.h"

#include <iostream>
#include <regex>

namespace {
const std::regex& SealedBlobPattern() {
    static const std::regex pattern{R"(\bv1:[A-Za-z0-9+/]{16,}={0,2})"};
    return pattern;
}

const std::regex& BotTokenPattern() {
    static const std::regex pattern{R"(\b\d{8,10}:[A-Za-z0-9_-]{35}\b)"};
    return pattern;
}

const std::regex& SecretAssignmentPattern() {
    static const std::regex pattern{R"(((?:token|password|secret|credential)\s*[=:]\s*)[^\s,;&"']+)",
        std::regex::ECMAScript | std::regex::icase};
    return pattern;
}

class RedactingLogDispatcher : public el::LogDispatchCallback {
protected:
    void handle(const el::LogDispatchData* data) override {
        if (data->dispatchAction() != el::base::DispatchAction::NormalLog) {
            return;
        }

        const auto* message = data->logMessage();
        auto* logger = message->logger();
        auto* configurations = logger->typedConfigurations();
        const auto level = message->level();

        const auto line = LogRedactor::Redact(logger->logBuilder()->build(message, true));

        if (configurations->toFile(level)) {
            auto* stream = configurations->fileStream(level);
            if (stream != nullptr && !stream->fail()) {
                *stream << line;
                stream->flush();
            }
        }

        if (configurations->toStandardOutput(level)) {
            std::cout << line << std::flush;
        }
    }
};
} // namespace

std::string LogRedactor::Redact(const std::string& line) {
    auto redacted = std::regex_replace(line, SealedBlobPattern(), "[SEALED]");
    redacted = std::regex_replace(redacted, BotTokenPattern(), "[REDACTED_TOKEN]");
    return std::regex_replace(redacted, SecretAssignmentPattern(), "$1[REDACTED]");
}

void InstallRedactingLogDispatcher() {
    el::Helpers::installLogDispatchCallback<RedactingLogDispatcher>("RedactingLogDispatcher");
    el::Helpers::uninstallLogDispatchCallback<el::base::DefaultLogDispatchCallback>("DefaultLogDispatchCallback");
}
