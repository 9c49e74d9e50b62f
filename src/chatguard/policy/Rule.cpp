#include "policy/Rule.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace policy {

namespace {
std::string Normalize(const std::string& name) {
    std::string normalized;
    normalized.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == ' ') {
            normalized.push_back('_');
        } else {
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return normalized;
}
} // namespace

RuleKind ParseRuleKind(const std::string& name) {
    const auto normalized = Normalize(name);

    for (auto kind : {RuleKind::Spam, RuleKind::Harassment, RuleKind::Nsfw, RuleKind::HateSpeech,
             RuleKind::Caps, RuleKind::Violence, RuleKind::Custom}) {
        if (normalized == ToString(kind)) {
            return kind;
        }
    }

    throw ParseError("unknown rule kind '" + name + "'");
}

RuleAction ParseRuleAction(const std::string& name) {
    const auto normalized = Normalize(name);

    for (auto action : {RuleAction::Delete, RuleAction::Warn, RuleAction::Log, RuleAction::Alert}) {
        if (normalized == ToString(action)) {
            return action;
        }
    }

    throw ParseError("unknown rule action '" + name + "'");
}

} // namespace policy
