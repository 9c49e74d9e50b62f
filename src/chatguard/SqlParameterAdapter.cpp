#include "SqlParameterAdapter.hpp"

#include "Database.hpp"

#include <cctype>

namespace {

bool IsParameterNameCharacter(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

} // namespace

NormalizedSql NormalizeNamedParameters(const std::string& sql) {
    NormalizedSql result;
    result.sql.reserve(sql.size());

    unsigned int position = 0;
    bool inLiteral = false;

    for (size_t i = 0; i < sql.size();) {
        const char c = sql[i];
        if (c == '\'') {
            inLiteral = !inLiteral;
        }

        if (c != '@' || inLiteral) {
            result.sql.push_back(c);
            ++i;
            continue;
        }

        const size_t start = i++;
        while (i < sql.size() && IsParameterNameCharacter(sql[i])) {
            ++i;
        }

        if (i == start + 1) {
            throw DatabaseException("sql", 0, "parameter marker without a name at offset " + std::to_string(start));
        }

        const std::string name = sql.substr(start, i - start);

        auto inserted = result.logicalIndexByName.emplace(name, static_cast<int>(result.positionsByLogicalIndex.size()));
        if (inserted.second) {
            result.positionsByLogicalIndex.emplace_back();
        }

        result.positionsByLogicalIndex[inserted.first->second].push_back(++position);
        result.sql.push_back('?');
    }

    return result;
}
