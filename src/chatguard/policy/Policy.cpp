#include "policy/Policy.hpp"

#include <sstream>

namespace policy {

std::vector<ParseError> Policy::Validate(const std::vector<Rule>& rules) {
    std::vector<ParseError> errors;
    std::set<RuleKind> seen;

    for (std::size_t i = 0; i < rules.size(); ++i) {
        const auto& rule = rules[i];
        std::ostringstream prefix;
        prefix << "rule " << (i + 1) << " (" << ToString(rule.kind) << "): ";

        if (rule.kind == RuleKind::None) {
            errors.emplace_back(prefix.str() + "missing kind");
        }

        if (rule.action == RuleAction::None) {
            errors.emplace_back(prefix.str() + "missing action");
        }

        if (!(rule.threshold >= 0.0 && rule.threshold <= 1.0)) {
            errors.emplace_back(prefix.str() + "threshold must be within [0, 1]");
        }

        if (!rule.patternSource.empty() && !rule.pattern) {
            errors.emplace_back(prefix.str() + "pattern was not compiled");
        }

        if (rule.kind == RuleKind::Custom && !rule.HasPattern() && !rule.HasLengthLimit()) {
            errors.emplace_back(prefix.str() + "custom rules need a pattern or a length limit");
        }

        if (rule.kind != RuleKind::Custom && !seen.insert(rule.kind).second) {
            errors.emplace_back(prefix.str() + "duplicate rule for this kind");
        }
    }

    return errors;
}

std::shared_ptr<const Policy> Policy::Create(std::vector<Rule> rules) {
    const auto errors = Validate(rules);
    if (!errors.empty()) {
        throw errors.front();
    }

    return std::shared_ptr<const Policy>(new Policy(std::move(rules)));
}

Policy::Policy(std::vector<Rule> rules)
    : rules_{std::move(rules)} {
    for (const auto& rule : rules_) {
        kinds_.insert(rule.kind);
    }
}

} // namespace policy
