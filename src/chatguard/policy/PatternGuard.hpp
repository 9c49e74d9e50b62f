#pragma once

#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace policy {

// Static ReDoS screening for rule patterns. Checks are done once, when a
// rule is compiled, never at match time.
class PatternGuard {
public:
    static constexpr std::size_t MAX_PATTERN_LENGTH = 100;
    static constexpr int MAX_REPETITION_COUNT = 1000;
    static constexpr int MAX_QUANTIFIED_GROUP_DEPTH = 2;

    // Throws UnsafePatternError when the pattern can backtrack
    // pathologically or is not a valid expression.
    static void Check(const std::string& pattern);

    // Check() followed by compilation (ECMAScript, case-insensitive).
    static std::shared_ptr<const std::regex> Compile(const std::string& pattern);

    // Checks every alternative on its own and compiles them joined with '|'.
    static std::shared_ptr<const std::regex> CompileAlternation(const std::vector<std::string>& alternatives,
        std::string& joinedSource);

    static std::string Escape(const std::string& literal);
};

} // namespace policy
