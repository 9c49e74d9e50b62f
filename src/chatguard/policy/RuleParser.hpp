#pragma once

#include "policy/Rule.hpp"

#include <string>
#include <vector>

namespace policy {

struct ParsedDocument {
    std::vector<Rule> rules;
    std::vector<ParseError> errors;
};

// Compiles short natural-language policy statements such as
// "don't allow 'buy now' spam" or "block links to example.com" into rules.
// The vocabulary is fixed; anything outside it is a ParseError.
class RuleParser {
public:
    explicit RuleParser(double defaultThreshold = 0.8);

    // Throws ParseError when nothing in the sentence is recognized and
    // UnsafePatternError when a quoted pattern fails the safety check.
    std::vector<Rule> Parse(const std::string& sentence) const;

    // Splits a document into sentences and parses each one. Failing
    // sentences are reported in ParsedDocument::errors.
    ParsedDocument ParseDocument(const std::string& document) const;

    static std::vector<std::string> SplitSentences(const std::string& document);

private:
    double defaultThreshold_;
};

} // namespace policy
