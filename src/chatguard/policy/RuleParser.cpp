#include "policy/RuleParser.hpp"

#include "policy/PatternGuard.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <iterator>
#include <map>
#include <utility>

namespace policy {

namespace {

const std::map<std::string, RuleKind>& SubjectKeywords() {
    static const std::map<std::string, RuleKind> keywords{
        {"spam", RuleKind::Spam},
        {"spamming", RuleKind::Spam},
        {"repeated", RuleKind::Spam},
        {"repetitive", RuleKind::Spam},
        {"advertising", RuleKind::Spam},
        {"advertisements", RuleKind::Spam},
        {"ads", RuleKind::Spam},
        {"harassment", RuleKind::Harassment},
        {"bullying", RuleKind::Harassment},
        {"insults", RuleKind::Harassment},
        {"abuse", RuleKind::Harassment},
        {"abusive", RuleKind::Harassment},
        {"nsfw", RuleKind::Nsfw},
        {"adult", RuleKind::Nsfw},
        {"nudity", RuleKind::Nsfw},
        {"explicit", RuleKind::Nsfw},
        {"porn", RuleKind::Nsfw},
        {"pornography", RuleKind::Nsfw},
        {"hate", RuleKind::HateSpeech},
        {"hateful", RuleKind::HateSpeech},
        {"hate speech", RuleKind::HateSpeech},
        {"slurs", RuleKind::HateSpeech},
        {"racism", RuleKind::HateSpeech},
        {"caps", RuleKind::Caps},
        {"all caps", RuleKind::Caps},
        {"shouting", RuleKind::Caps},
        {"violence", RuleKind::Violence},
        {"violent", RuleKind::Violence},
        {"gore", RuleKind::Violence},
        {"threats", RuleKind::Violence},
        {"weapons", RuleKind::Violence},
    };
    return keywords;
}

struct Literal {
    std::string text;
};

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// Pulls quoted literals out of the sentence. Apostrophes inside words
// ("don't") are not quotes. The remainder keeps a space where each literal
// was so surrounding words stay separated.
std::string ExtractLiterals(const std::string& sentence, std::vector<Literal>& literals) {
    std::string remainder;
    remainder.reserve(sentence.size());

    std::size_t pos = 0;
    while (pos < sentence.size()) {
        const char c = sentence[pos];
        const bool opens = (c == '\'' || c == '"') && (pos == 0 || !IsWordChar(sentence[pos - 1]));

        if (opens) {
            std::size_t close = pos + 1;
            while (close < sentence.size()) {
                if (sentence[close] == c && (close + 1 >= sentence.size() || !IsWordChar(sentence[close + 1]))) {
                    break;
                }
                ++close;
            }

            if (close < sentence.size() && close > pos + 1) {
                literals.push_back(Literal{sentence.substr(pos + 1, close - pos - 1)});
                remainder.push_back(' ');
                pos = close + 1;
                continue;
            }
        }

        remainder.push_back(c);
        ++pos;
    }

    return remainder;
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::vector<std::string> Tokenize(const std::string& text) {
    static const std::string STRIP = ",;:!?()[]\"";

    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&tokens, &current]() {
        std::size_t begin = 0;
        std::size_t end = current.size();
        while (begin < end && STRIP.find(current[begin]) != std::string::npos) {
            ++begin;
        }
        while (end > begin && (STRIP.find(current[end - 1]) != std::string::npos || current[end - 1] == '.')) {
            --end;
        }
        if (end > begin) {
            tokens.push_back(current.substr(begin, end - begin));
        }
        current.clear();
    };

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    flush();

    return tokens;
}

bool HasPhrase(const std::vector<std::string>& tokens, std::initializer_list<const char*> phrase) {
    const std::vector<std::string> words(phrase.begin(), phrase.end());
    if (words.empty() || tokens.size() < words.size()) {
        return false;
    }

    for (std::size_t i = 0; i + words.size() <= tokens.size(); ++i) {
        if (std::equal(words.begin(), words.end(), tokens.begin() + static_cast<std::ptrdiff_t>(i))) {
            return true;
        }
    }

    return false;
}

bool HasToken(const std::vector<std::string>& tokens, const char* word) {
    return std::find(tokens.begin(), tokens.end(), word) != tokens.end();
}

RuleAction DetectAction(const std::vector<std::string>& tokens) {
    if (HasPhrase(tokens, {"don't", "allow"}) || HasPhrase(tokens, {"dont", "allow"})
        || HasPhrase(tokens, {"do", "not", "allow"}) || HasPhrase(tokens, {"never", "allow"})
        || HasPhrase(tokens, {"not", "allowed"}) || HasPhrase(tokens, {"isn't", "allowed"})
        || HasPhrase(tokens, {"aren't", "allowed"})) {
        return RuleAction::Delete;
    }

    for (const char* verb : {"block", "remove", "ban", "delete", "forbid"}) {
        if (HasToken(tokens, verb)) {
            return RuleAction::Delete;
        }
    }

    if (!tokens.empty() && tokens.front() == "no") {
        return RuleAction::Delete;
    }

    for (const char* verb : {"warn", "flag"}) {
        if (HasToken(tokens, verb)) {
            return RuleAction::Warn;
        }
    }

    for (const char* verb : {"alert", "report"}) {
        if (HasToken(tokens, verb)) {
            return RuleAction::Alert;
        }
    }

    for (const char* verb : {"log", "monitor", "allow"}) {
        if (HasToken(tokens, verb)) {
            return RuleAction::Log;
        }
    }

    return RuleAction::None;
}

std::vector<RuleKind> DetectCategories(const std::vector<std::string>& tokens) {
    const auto& keywords = SubjectKeywords();
    std::vector<RuleKind> kinds;

    auto add = [&kinds](RuleKind kind) {
        if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) {
            kinds.push_back(kind);
        }
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i + 1 < tokens.size()) {
            auto pair = keywords.find(tokens[i] + " " + tokens[i + 1]);
            if (pair != keywords.end()) {
                add(pair->second);
                ++i;
                continue;
            }
        }

        auto single = keywords.find(tokens[i]);
        if (single != keywords.end()) {
            add(single->second);
        }
    }

    return kinds;
}

bool ParseCount(const std::string& token, std::size_t& value) {
    if (token.empty() || !std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isdigit(c); })
        || token.size() > 9) {
        return false;
    }

    value = static_cast<std::size_t>(std::strtoul(token.c_str(), nullptr, 10));
    return value > 0;
}

bool IsCharacterUnit(const std::vector<std::string>& tokens, std::size_t index) {
    return index < tokens.size() && tokens[index].compare(0, 4, "char") == 0;
}

// "longer than N characters", "more than N chars", "limit messages to N
// characters", "max length N", "maximum message length is N".
std::size_t DetectLengthLimit(const std::vector<std::string>& tokens) {
    std::size_t value = 0;

    for (std::size_t i = 0; i + 2 < tokens.size(); ++i) {
        if ((tokens[i] == "longer" || tokens[i] == "more") && tokens[i + 1] == "than"
            && ParseCount(tokens[i + 2], value) && IsCharacterUnit(tokens, i + 3)) {
            return value;
        }
    }

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] != "limit") {
            continue;
        }
        for (std::size_t j = i + 1; j < tokens.size() && j <= i + 3; ++j) {
            if (tokens[j] == "to" && j + 1 < tokens.size() && ParseCount(tokens[j + 1], value)
                && IsCharacterUnit(tokens, j + 2)) {
                return value;
            }
        }
    }

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] != "length") {
            continue;
        }
        const bool qualified = (i >= 1 && (tokens[i - 1] == "max" || tokens[i - 1] == "maximum"))
            || (i >= 2 && (tokens[i - 2] == "max" || tokens[i - 2] == "maximum"));
        if (!qualified) {
            continue;
        }
        std::size_t next = i + 1;
        if (next < tokens.size() && tokens[next] == "is") {
            ++next;
        }
        if (next < tokens.size() && ParseCount(tokens[next], value)) {
            return value;
        }
    }

    return 0;
}

bool LooksLikeDomain(const std::string& token) {
    const auto dot = token.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= token.size()) {
        return false;
    }

    return std::all_of(token.begin(), token.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '-' || c == '/' || c == '_';
    });
}

// "links to a.com and b.net", "no links to c.org".
std::vector<std::string> DetectBlockedDomains(const std::vector<std::string>& tokens) {
    std::vector<std::string> domains;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i] != "link" && tokens[i] != "links") {
            continue;
        }

        std::size_t next = i + 1;
        if (next < tokens.size() && tokens[next] == "to") {
            ++next;
        }

        for (; next < tokens.size(); ++next) {
            const auto& token = tokens[next];
            if (LooksLikeDomain(token)) {
                if (std::find(domains.begin(), domains.end(), token) == domains.end()) {
                    domains.push_back(token);
                }
            } else if (token != "and" && token != "or") {
                break;
            }
        }
    }

    return domains;
}

RuleKind KindOfLiteral(const std::string& literal) {
    const auto& keywords = SubjectKeywords();
    auto found = keywords.find(ToLower(literal));
    return found == keywords.end() ? RuleKind::None : found->second;
}

} // namespace

RuleParser::RuleParser(double defaultThreshold)
    : defaultThreshold_{defaultThreshold} {}

std::vector<Rule> RuleParser::Parse(const std::string& sentence) const {
    std::vector<Literal> literals;
    const auto bare = ExtractLiterals(sentence, literals);
    const auto tokens = Tokenize(bare);

    const auto verbAction = DetectAction(tokens);
    const auto categories = DetectCategories(tokens);
    const auto lengthLimit = DetectLengthLimit(tokens);
    const auto domains = DetectBlockedDomains(tokens);

    const bool subjectFound = !categories.empty() || !literals.empty();
    if ((verbAction == RuleAction::None || !subjectFound) && lengthLimit == 0 && domains.empty()) {
        throw ParseError("no recognizable rule pattern in '" + sentence + "'");
    }

    auto makeRule = [this, &sentence](RuleKind kind, RuleAction action) {
        Rule rule;
        rule.kind = kind;
        rule.threshold = defaultThreshold_;
        rule.action = action;
        rule.source = sentence;
        return rule;
    };

    std::vector<Rule> rules;

    if (verbAction != RuleAction::None && subjectFound) {
        // Route each literal to a kind. Literals naming a category take that
        // category, otherwise they attach to the only category in the
        // sentence or stand alone as custom rules.
        std::map<RuleKind, std::vector<std::string>> literalsByKind;
        std::vector<std::string> customLiterals;
        for (const auto& literal : literals) {
            auto kind = KindOfLiteral(literal.text);
            if (kind == RuleKind::None && categories.size() == 1) {
                kind = categories.front();
            }

            if (kind == RuleKind::None) {
                customLiterals.push_back(literal.text);
            } else {
                literalsByKind[kind].push_back(literal.text);
            }
        }

        std::vector<RuleKind> orderedKinds = categories;
        for (const auto& entry : literalsByKind) {
            if (std::find(orderedKinds.begin(), orderedKinds.end(), entry.first) == orderedKinds.end()) {
                orderedKinds.push_back(entry.first);
            }
        }

        for (auto kind : orderedKinds) {
            auto rule = makeRule(kind, verbAction);
            auto patterns = literalsByKind.find(kind);
            if (patterns != literalsByKind.end()) {
                rule.pattern = PatternGuard::CompileAlternation(patterns->second, rule.patternSource);
            }
            rules.push_back(std::move(rule));
        }

        for (const auto& literal : customLiterals) {
            auto rule = makeRule(RuleKind::Custom, verbAction);
            rule.patternSource = literal;
            rule.pattern = PatternGuard::Compile(literal);
            rules.push_back(std::move(rule));
        }
    }

    for (const auto& domain : domains) {
        auto rule = makeRule(RuleKind::Custom, verbAction == RuleAction::None ? RuleAction::Delete : verbAction);
        rule.patternSource = PatternGuard::Escape(domain);
        rule.pattern = PatternGuard::Compile(rule.patternSource);
        rules.push_back(std::move(rule));
    }

    if (lengthLimit > 0) {
        auto rule = makeRule(RuleKind::Custom, verbAction == RuleAction::None ? RuleAction::Warn : verbAction);
        rule.maxLength = lengthLimit;
        rules.push_back(std::move(rule));
    }

    if (rules.empty()) {
        throw ParseError("no recognizable rule pattern in '" + sentence + "'");
    }

    return rules;
}

ParsedDocument RuleParser::ParseDocument(const std::string& document) const {
    ParsedDocument parsed;

    for (const auto& sentence : SplitSentences(document)) {
        try {
            auto rules = Parse(sentence);
            std::move(rules.begin(), rules.end(), std::back_inserter(parsed.rules));
        } catch (const ParseError& e) {
            parsed.errors.push_back(e);
        }
    }

    return parsed;
}

std::vector<std::string> RuleParser::SplitSentences(const std::string& document) {
    std::vector<std::string> sentences;
    std::string current;

    auto flush = [&sentences, &current]() {
        auto begin = current.find_first_not_of(" \t\r");
        if (begin != std::string::npos) {
            auto end = current.find_last_not_of(" \t\r");
            auto sentence = current.substr(begin, end - begin + 1);
            // Section headers such as "Gaming Server Rules:" carry no rule.
            if (sentence.back() != ':') {
                sentences.push_back(sentence);
            }
        }
        current.clear();
    };

    // Terminators inside a quoted literal belong to the literal. Quotes open
    // and close by the same rule ExtractLiterals uses; a line break always
    // ends the sentence.
    char quote = 0;
    for (std::size_t i = 0; i < document.size(); ++i) {
        const char c = document[i];
        const bool atBoundary = i + 1 >= document.size() || std::isspace(static_cast<unsigned char>(document[i + 1]));

        if (c == '\n') {
            quote = 0;
            flush();
            continue;
        }

        if (quote == 0 && (c == '\'' || c == '"') && (i == 0 || !IsWordChar(document[i - 1]))) {
            quote = c;
        } else if (quote != 0 && c == quote && (i + 1 >= document.size() || !IsWordChar(document[i + 1]))) {
            quote = 0;
        } else if (quote == 0 && (c == '.' || c == '!' || c == '?') && atBoundary) {
            flush();
            continue;
        }

        current.push_back(c);
    }
    flush();

    return sentences;
}

} // namespace policy
