#pragma once

#include "policy/Policy.hpp"
#include "policy/RuleParser.hpp"

#include <memory>
#include <string>
#include <vector>

namespace policy {

// Structured rule as written in configuration: kind:threshold:action[:pattern]
struct RuleRecord {
    std::string kind;
    double threshold = 0.0;
    std::string action;
    std::string pattern;
};

struct PolicyLoadResult {
    std::shared_ptr<const Policy> policy;
    std::vector<ParseError> errors;

    bool Ok() const { return policy != nullptr && errors.empty(); }
};

// Builds policies all-or-nothing: a single bad record or sentence leaves
// PolicyLoadResult::policy empty and lists every error found.
class PolicyLoader {
public:
    explicit PolicyLoader(const RuleParser& parser);

    PolicyLoadResult FromRecords(const std::vector<RuleRecord>& records) const;
    PolicyLoadResult FromSentences(const std::vector<std::string>& sentences) const;

    // Records are placed first, then the rules of every sentence in order.
    PolicyLoadResult FromSources(const std::vector<RuleRecord>& records,
        const std::vector<std::string>& sentences) const;

    // One sentence per line; blank lines and lines starting with '#' are
    // skipped.
    PolicyLoadResult FromFile(const std::string& path, const std::vector<RuleRecord>& records = {}) const;

    static RuleRecord ParseRecord(const std::string& text);
    static std::vector<std::string> ReadSentenceFile(const std::string& path);

private:
    Rule CompileRecord(const RuleRecord& record) const;

    const RuleParser& parser_;
};

} // namespace policy
