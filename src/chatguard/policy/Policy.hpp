#pragma once

#include "policy/Rule.hpp"

#include <memory>
#include <set>
#include <vector>

namespace policy {

// Ordered, immutable rule set. Rules are unique by kind except for custom
// rules. Policies are only ever handed out as shared_ptr<const Policy> so a
// reconfiguration swaps the whole value.
class Policy {
public:
    // Returns every problem found in the rule set; empty means the rules can
    // be activated.
    static std::vector<ParseError> Validate(const std::vector<Rule>& rules);

    // Throws the first ParseError reported by Validate.
    static std::shared_ptr<const Policy> Create(std::vector<Rule> rules);

    const std::vector<Rule>& Rules() const { return rules_; }
    const std::set<RuleKind>& Kinds() const { return kinds_; }
    std::size_t Size() const { return rules_.size(); }
    bool Empty() const { return rules_.empty(); }

private:
    explicit Policy(std::vector<Rule> rules);

    std::vector<Rule> rules_;
    std::set<RuleKind> kinds_;
};

} // namespace policy
