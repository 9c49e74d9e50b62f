#pragma once

#include <string>
#include <unordered_map>
#include <vector>

// SQL with every @name parameter replaced by a positional '?'. A name used
// more than once maps to one logical index bound at every position.
struct NormalizedSql {
    std::string sql;
    std::unordered_map<std::string, int> logicalIndexByName;
    std::vector<std::vector<unsigned int>> positionsByLogicalIndex;
};

// '@' inside single-quoted literals is left untouched.
NormalizedSql NormalizeNamedParameters(const std::string& sql);
