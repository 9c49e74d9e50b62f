#pragma once

#include <string>

// Masks credential material in log lines: platform bot tokens, key=value
// pairs whose key names a secret, and sealed secret blobs.
class LogRedactor {
public:
    static std::string Redact(const std::string& line);
};

// Replaces the default easylogging++ dispatcher with one that passes every
// line through LogRedactor before it reaches stdout or the log file.
void InstallRedactingLogDispatcher();
