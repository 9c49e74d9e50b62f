#include "policy/PolicyLoader.hpp"

#include "policy/PatternGuard.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

namespace policy {

namespace {
std::string Trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}
} // namespace

PolicyLoader::PolicyLoader(const RuleParser& parser)
    : parser_{parser} {}

PolicyLoadResult PolicyLoader::FromRecords(const std::vector<RuleRecord>& records) const {
    return FromSources(records, {});
}

PolicyLoadResult PolicyLoader::FromSentences(const std::vector<std::string>& sentences) const {
    return FromSources({}, sentences);
}

PolicyLoadResult PolicyLoader::FromSources(const std::vector<RuleRecord>& records,
    const std::vector<std::string>& sentences) const {
    PolicyLoadResult result;
    std::vector<Rule> rules;

    for (const auto& record : records) {
        try {
            rules.push_back(CompileRecord(record));
        } catch (const ParseError& e) {
            result.errors.push_back(e);
        }
    }

    for (const auto& sentence : sentences) {
        try {
            auto parsed = parser_.Parse(sentence);
            std::move(parsed.begin(), parsed.end(), std::back_inserter(rules));
        } catch (const ParseError& e) {
            result.errors.push_back(e);
        }
    }

    if (result.errors.empty()) {
        auto problems = Policy::Validate(rules);
        std::move(problems.begin(), problems.end(), std::back_inserter(result.errors));
    }

    if (result.errors.empty()) {
        result.policy = Policy::Create(std::move(rules));
    }

    return result;
}

PolicyLoadResult PolicyLoader::FromFile(const std::string& path, const std::vector<RuleRecord>& records) const {
    std::vector<std::string> sentences;
    try {
        sentences = ReadSentenceFile(path);
    } catch (const ParseError& e) {
        PolicyLoadResult result;
        result.errors.push_back(e);
        return result;
    }

    return FromSources(records, sentences);
}

RuleRecord PolicyLoader::ParseRecord(const std::string& text) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream in{text};

    // The pattern is everything after the third separator and may itself
    // contain ':'.
    for (int i = 0; i < 3 && std::getline(in, field, ':'); ++i) {
        fields.push_back(Trim(field));
    }

    if (fields.size() < 3) {
        throw ParseError("rule record '" + text + "' must be kind:threshold:action[:pattern]");
    }

    RuleRecord record;
    record.kind = fields[0];
    record.action = fields[2];
    std::getline(in, record.pattern);
    record.pattern = Trim(record.pattern);

    char* end = nullptr;
    record.threshold = std::strtod(fields[1].c_str(), &end);
    if (fields[1].empty() || end == nullptr || *end != '\0') {
        throw ParseError("rule record '" + text + "' has a malformed threshold");
    }

    return record;
}

std::vector<std::string> PolicyLoader::ReadSentenceFile(const std::string& path) {
    std::ifstream in{path.c_str()};
    if (!in) {
        throw ParseError("cannot open policy file: " + path);
    }

    std::vector<std::string> sentences;
    std::string line;
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        sentences.push_back(line);
    }

    return sentences;
}

Rule PolicyLoader::CompileRecord(const RuleRecord& record) const {
    Rule rule;
    rule.kind = ParseRuleKind(record.kind);
    rule.action = ParseRuleAction(record.action);
    rule.threshold = record.threshold;
    rule.source = record.kind + ":" + std::to_string(record.threshold) + ":" + record.action;

    if (!(rule.threshold >= 0.0 && rule.threshold <= 1.0)) {
        throw ParseError("rule record for " + record.kind + " has threshold outside [0, 1]");
    }

    if (!record.pattern.empty()) {
        rule.patternSource = record.pattern;
        rule.pattern = PatternGuard::Compile(record.pattern);
        rule.source += ":" + record.pattern;
    }

    return rule;
}

} // namespace policy
