#pragma once

#include <memory>
#include <regex>
#include <stdexcept>
#include <string>

namespace policy {

enum class RuleKind {
    None,
    Spam,
    Harassment,
    Nsfw,
    HateSpeech,
    Caps,
    Violence,
    Custom,
};

enum class RuleAction {
    None,
    Delete,
    Warn,
    Log,
    Alert,
};

enum class ParseErrorKind {
    Syntax,
    UnsafePattern,
};

inline const char* ToString(ParseErrorKind kind) {
    switch (kind) {
    case ParseErrorKind::Syntax:
        return "syntax";
    case ParseErrorKind::UnsafePattern:
        return "unsafe_pattern";
    }

    return "unknown";
}

// Errors are collected by value, so the kind and the offending pattern live
// in the base class and survive copying.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error(message) {}

    ParseErrorKind Kind() const { return kind_; }

    // Empty unless Kind() is UnsafePattern.
    const std::string& Pattern() const { return pattern_; }

protected:
    ParseError(const std::string& message, ParseErrorKind kind, std::string pattern)
        : std::runtime_error(message)
        , kind_{kind}
        , pattern_{std::move(pattern)} {}

private:
    ParseErrorKind kind_ = ParseErrorKind::Syntax;
    std::string pattern_;
};

class UnsafePatternError : public ParseError {
public:
    UnsafePatternError(const std::string& pattern, const std::string& message)
        : ParseError("unsafe pattern '" + pattern + "': " + message, ParseErrorKind::UnsafePattern, pattern) {}
};

// Compiled rule. Instances are immutable once built and may be shared
// between policies and threads.
struct Rule {
    RuleKind kind = RuleKind::Custom;
    double threshold = 0.8;
    RuleAction action = RuleAction::Log;
    std::string patternSource;
    std::shared_ptr<const std::regex> pattern;
    std::size_t maxLength = 0;
    std::string source;

    bool HasPattern() const { return pattern != nullptr; }

    bool HasLengthLimit() const { return maxLength > 0; }
};

// Active actions are the ones the platform has to enforce.
inline bool IsActiveAction(RuleAction action) {
    return action == RuleAction::Delete || action == RuleAction::Warn || action == RuleAction::Alert;
}

inline const char* ToString(RuleKind kind) {
    switch (kind) {
    case RuleKind::None:
        return "none";
    case RuleKind::Spam:
        return "spam";
    case RuleKind::Harassment:
        return "harassment";
    case RuleKind::Nsfw:
        return "nsfw";
    case RuleKind::HateSpeech:
        return "hate_speech";
    case RuleKind::Caps:
        return "caps";
    case RuleKind::Violence:
        return "violence";
    case RuleKind::Custom:
        return "custom";
    }

    return "none";
}

inline const char* ToString(RuleAction action) {
    switch (action) {
    case RuleAction::None:
        return "none";
    case RuleAction::Delete:
        return "delete";
    case RuleAction::Warn:
        return "warn";
    case RuleAction::Log:
        return "log";
    case RuleAction::Alert:
        return "alert";
    }

    return "none";
}

RuleKind ParseRuleKind(const std::string& name);
RuleAction ParseRuleAction(const std::string& name);

} // namespace policy
