#include "policy/PatternGuard.hpp"

#include "policy/Rule.hpp"

#include <algorithm>
#include <bitset>
#include <cctype>
#include <set>
#include <vector>

namespace policy {

constexpr std::size_t PatternGuard::MAX_PATTERN_LENGTH;
constexpr int PatternGuard::MAX_REPETITION_COUNT;
constexpr int PatternGuard::MAX_QUANTIFIED_GROUP_DEPTH;

namespace {

// Bytes an atom can match, ASCII case folded.
using CharSet = std::bitset<256>;

struct AtomInfo {
    bool present = false;
    bool isGroup = false;
    bool containsUnbounded = false;
    bool ambiguousAlternation = false;
    int quantifiedDepth = 0;
    CharSet chars;
    // Lower-cased character when the atom is a single literal.
    std::string literal;
};

struct Quantifier {
    bool unbounded = false;
    int minCount = 1;
    int maxCount = 1;
};

struct GroupFrame {
    AtomInfo contents;

    bool hasAlternation = false;
    bool literalBranches = true;
    std::set<std::string> branchLiterals;

    int branchAtoms = 0;
    bool branchQuantified = false;
    std::string branchLiteral;

    bool afterUnbounded = false;
    CharSet unboundedChars;
};

void AddFolded(CharSet& set, unsigned char c) {
    set.set(c);
    set.set(static_cast<unsigned char>(std::tolower(c)));
    set.set(static_cast<unsigned char>(std::toupper(c)));
}

bool IsClassEscape(char c) {
    switch (c) {
    case 'd': case 'D': case 'w': case 'W': case 's': case 'S':
        return true;
    default:
        return false;
    }
}

CharSet ClassEscape(char c) {
    CharSet set;
    for (int i = 0; i < 256; ++i) {
        bool matches = false;
        switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'd':
            matches = std::isdigit(i) != 0;
            break;
        case 'w':
            matches = std::isalnum(i) != 0 || i == '_';
            break;
        default:
            matches = std::isspace(i) != 0;
            break;
        }

        set[static_cast<std::size_t>(i)] = std::isupper(static_cast<unsigned char>(c)) ? !matches : matches;
    }
    return set;
}

char EscapedLiteral(char c) {
    switch (c) {
    case 'n': return '\n';
    case 'r': return '\r';
    case 't': return '\t';
    case 'f': return '\f';
    case 'v': return '\v';
    case '0': return '\0';
    default: return c;
    }
}

int ReadNumber(const std::string& pattern, std::size_t& pos) {
    int value = 0;
    std::size_t digits = 0;
    while (pos < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[pos]))) {
        value = value * 10 + (pattern[pos] - '0');
        ++pos;
        if (++digits > 6) {
            throw UnsafePatternError(pattern, "repetition count too large");
        }
    }

    if (digits == 0) {
        return -1;
    }

    return value;
}

// Parses a counted repetition starting at '{'. Advances pos past '}'.
Quantifier ReadCountedRepetition(const std::string& pattern, std::size_t& pos) {
    ++pos;
    Quantifier quantifier;
    quantifier.minCount = ReadNumber(pattern, pos);
    if (quantifier.minCount < 0) {
        throw UnsafePatternError(pattern, "malformed repetition");
    }

    quantifier.maxCount = quantifier.minCount;
    if (pos < pattern.size() && pattern[pos] == ',') {
        ++pos;
        int maxCount = ReadNumber(pattern, pos);
        if (maxCount < 0) {
            quantifier.unbounded = true;
        } else {
            if (maxCount < quantifier.minCount) {
                throw UnsafePatternError(pattern, "repetition bounds out of order");
            }
            quantifier.maxCount = maxCount;
        }
    }

    if (pos >= pattern.size() || pattern[pos] != '}') {
        throw UnsafePatternError(pattern, "malformed repetition");
    }
    ++pos;

    if (quantifier.maxCount > PatternGuard::MAX_REPETITION_COUNT) {
        throw UnsafePatternError(pattern, "repetition count exceeds "
            + std::to_string(PatternGuard::MAX_REPETITION_COUNT));
    }

    return quantifier;
}

// Reads a bracket expression starting at '['. Advances pos past ']'.
CharSet ReadCharacterClass(const std::string& pattern, std::size_t& pos) {
    ++pos;
    bool negated = false;
    if (pos < pattern.size() && pattern[pos] == '^') {
        negated = true;
        ++pos;
    }

    CharSet set;
    bool first = true;
    while (pos < pattern.size() && (pattern[pos] != ']' || first)) {
        first = false;

        unsigned char low = static_cast<unsigned char>(pattern[pos]);
        if (low == '\\') {
            if (pos + 1 >= pattern.size()) {
                break;
            }
            const char escaped = pattern[pos + 1];
            pos += 2;
            if (IsClassEscape(escaped)) {
                set |= ClassEscape(escaped);
                continue;
            }
            low = static_cast<unsigned char>(EscapedLiteral(escaped));
        } else {
            ++pos;
        }

        unsigned char high = low;
        if (pos + 1 < pattern.size() && pattern[pos] == '-' && pattern[pos + 1] != ']') {
            high = static_cast<unsigned char>(pattern[pos + 1]);
            if (high == '\\' && pos + 2 < pattern.size()) {
                high = static_cast<unsigned char>(EscapedLiteral(pattern[pos + 2]));
                ++pos;
            }
            pos += 2;
        }

        for (int c = low; c <= high; ++c) {
            AddFolded(set, static_cast<unsigned char>(c));
        }
    }

    if (pos >= pattern.size()) {
        throw UnsafePatternError(pattern, "unterminated character class");
    }
    ++pos;

    return negated ? ~set : set;
}

AtomInfo LiteralAtom(char c) {
    AtomInfo atom;
    atom.present = true;
    AddFolded(atom.chars, static_cast<unsigned char>(c));
    atom.literal = std::string(1, static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return atom;
}

AtomInfo SetAtom(const CharSet& chars) {
    AtomInfo atom;
    atom.present = true;
    atom.chars = chars;
    return atom;
}

// Adds a finished atom, with its quantifier if it has one, to the
// enclosing group.
void Commit(const std::string& pattern, GroupFrame& frame, const AtomInfo& atom, const Quantifier& quantifier,
    bool quantified) {
    const bool repeats = quantified && (quantifier.unbounded || quantifier.maxCount > 1);

    AtomInfo merged = atom;
    if (atom.isGroup && repeats) {
        if (atom.containsUnbounded) {
            throw UnsafePatternError(pattern, "nested unbounded quantifier");
        }
        if (atom.ambiguousAlternation) {
            throw UnsafePatternError(pattern, "repeated alternation with overlapping branches");
        }
        merged.quantifiedDepth = atom.quantifiedDepth + 1;
        if (merged.quantifiedDepth > PatternGuard::MAX_QUANTIFIED_GROUP_DEPTH) {
            throw UnsafePatternError(pattern, "quantified groups nested too deeply");
        }
    }

    const bool unbounded = quantified && quantifier.unbounded;
    if (unbounded) {
        if (frame.afterUnbounded && (frame.unboundedChars & atom.chars).any()) {
            throw UnsafePatternError(pattern, "adjacent unbounded quantifiers overlap");
        }
        frame.afterUnbounded = true;
        frame.unboundedChars = atom.chars;
    } else if (!quantified || quantifier.minCount > 0) {
        frame.afterUnbounded = false;
    }

    ++frame.branchAtoms;
    frame.branchLiteral = atom.literal;
    frame.branchQuantified = frame.branchQuantified || quantified;

    auto& contents = frame.contents;
    contents.containsUnbounded = contents.containsUnbounded || merged.containsUnbounded || unbounded;
    contents.ambiguousAlternation = contents.ambiguousAlternation || merged.ambiguousAlternation;
    contents.quantifiedDepth = std::max(contents.quantifiedDepth, merged.quantifiedDepth);
    contents.chars |= merged.chars;
}

// Only branches made of one distinct literal character each may be
// repeated without ambiguity.
void EndBranch(GroupFrame& frame) {
    const bool single = frame.branchAtoms == 1 && !frame.branchQuantified && !frame.branchLiteral.empty();
    if (!single || !frame.branchLiterals.insert(frame.branchLiteral).second) {
        frame.literalBranches = false;
    }

    frame.branchAtoms = 0;
    frame.branchQuantified = false;
    frame.branchLiteral.clear();
    frame.afterUnbounded = false;
}

} // namespace

void PatternGuard::Check(const std::string& pattern) {
    if (pattern.empty()) {
        throw UnsafePatternError(pattern, "empty pattern");
    }

    if (pattern.size() > MAX_PATTERN_LENGTH) {
        throw UnsafePatternError(pattern, "pattern longer than " + std::to_string(MAX_PATTERN_LENGTH));
    }

    std::vector<GroupFrame> frames(1);
    AtomInfo last;
    std::size_t pos = 0;

    auto commitPending = [&]() {
        if (last.present) {
            Commit(pattern, frames.back(), last, Quantifier{}, false);
        }
        last = AtomInfo{};
    };

    while (pos < pattern.size()) {
        const char c = pattern[pos];

        if (c == '*' || c == '+' || c == '?' || c == '{') {
            if (!last.present) {
                throw UnsafePatternError(pattern, "quantifier without operand");
            }

            Quantifier quantifier;
            if (c == '{') {
                quantifier = ReadCountedRepetition(pattern, pos);
            } else {
                quantifier.unbounded = c != '?';
                quantifier.minCount = c == '+' ? 1 : 0;
                quantifier.maxCount = 1;
                ++pos;
            }

            // lazy modifier
            if (pos < pattern.size() && pattern[pos] == '?') {
                ++pos;
            }

            Commit(pattern, frames.back(), last, quantifier, true);
            last = AtomInfo{};
            continue;
        }

        commitPending();

        switch (c) {
        case '\\': {
            if (pos + 1 >= pattern.size()) {
                throw UnsafePatternError(pattern, "trailing escape");
            }
            const char escaped = pattern[pos + 1];
            if (std::isdigit(static_cast<unsigned char>(escaped)) && escaped != '0') {
                throw UnsafePatternError(pattern, "back-references are not allowed");
            }
            pos += 2;

            if (IsClassEscape(escaped)) {
                last = SetAtom(ClassEscape(escaped));
            } else if (escaped == 'b' || escaped == 'B') {
                // zero width
                last = AtomInfo{};
                last.present = true;
            } else if (escaped == 'x' || escaped == 'u' || escaped == 'c') {
                last = SetAtom(CharSet{}.set());
            } else {
                last = LiteralAtom(EscapedLiteral(escaped));
            }
            break;
        }
        case '[':
            last = SetAtom(ReadCharacterClass(pattern, pos));
            break;
        case '.': {
            auto any = CharSet{}.set();
            any.reset('\n');
            any.reset('\r');
            last = SetAtom(any);
            ++pos;
            break;
        }
        case '(':
            ++pos;
            if (pos < pattern.size() && pattern[pos] == '?') {
                if (pos + 1 < pattern.size()
                    && (pattern[pos + 1] == ':' || pattern[pos + 1] == '=' || pattern[pos + 1] == '!')) {
                    pos += 2;
                } else {
                    throw UnsafePatternError(pattern, "unsupported group construct");
                }
            }
            frames.emplace_back();
            break;
        case ')': {
            if (frames.size() == 1) {
                throw UnsafePatternError(pattern, "unbalanced parenthesis");
            }
            auto& frame = frames.back();
            EndBranch(frame);

            AtomInfo group = frame.contents;
            group.present = true;
            group.isGroup = true;
            group.literal.clear();
            group.ambiguousAlternation =
                group.ambiguousAlternation || (frame.hasAlternation && !frame.literalBranches);

            frames.pop_back();
            last = group;
            ++pos;
            break;
        }
        case '|':
            EndBranch(frames.back());
            frames.back().hasAlternation = true;
            ++pos;
            break;
        case '^':
        case '$':
            ++pos;
            break;
        default:
            last = LiteralAtom(c);
            ++pos;
            break;
        }
    }

    commitPending();

    if (frames.size() != 1) {
        throw UnsafePatternError(pattern, "unbalanced parenthesis");
    }
}

std::shared_ptr<const std::regex> PatternGuard::Compile(const std::string& pattern) {
    Check(pattern);

    try {
        return std::make_shared<const std::regex>(
            pattern, std::regex_constants::ECMAScript | std::regex_constants::icase);
    } catch (const std::regex_error& e) {
        throw UnsafePatternError(pattern, std::string{"invalid expression: "} + e.what());
    }
}

std::shared_ptr<const std::regex> PatternGuard::CompileAlternation(
    const std::vector<std::string>& alternatives, std::string& joinedSource) {
    if (alternatives.size() == 1) {
        joinedSource = alternatives.front();
        return Compile(joinedSource);
    }

    joinedSource.clear();
    for (const auto& alternative : alternatives) {
        Check(alternative);
        if (!joinedSource.empty()) {
            joinedSource.push_back('|');
        }
        joinedSource += "(?:" + alternative + ")";
    }

    try {
        return std::make_shared<const std::regex>(
            joinedSource, std::regex_constants::ECMAScript | std::regex_constants::icase);
    } catch (const std::regex_error& e) {
        throw UnsafePatternError(joinedSource, std::string{"invalid expression: "} + e.what());
    }
}

std::string PatternGuard::Escape(const std::string& literal) {
    static const std::string META = "\\^$.|?*+()[]{}";

    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char c : literal) {
        if (META.find(c) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }

    return escaped;
}

} // namespace policy
