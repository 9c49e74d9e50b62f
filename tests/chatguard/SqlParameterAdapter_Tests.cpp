#include "catch.hpp"

#include "Database.hpp"
#include "SqlParameterAdapter.hpp"

SCENARIO("named parameters become positional markers", "[database]") {
    auto normalized = NormalizeNamedParameters("SELECT a FROM t WHERE x = @x AND y = @y_2 OR z = @x");

    REQUIRE(normalized.sql == "SELECT a FROM t WHERE x = ? AND y = ? OR z = ?");
    REQUIRE(normalized.logicalIndexByName.size() == 2);
    REQUIRE(normalized.logicalIndexByName.at("@x") == 0);
    REQUIRE(normalized.logicalIndexByName.at("@y_2") == 1);
    REQUIRE(normalized.positionsByLogicalIndex[0] == std::vector<unsigned int>{1, 3});
    REQUIRE(normalized.positionsByLogicalIndex[1] == std::vector<unsigned int>{2});
}

SCENARIO("'@' inside string literals is not a parameter", "[database]") {
    auto normalized = NormalizeNamedParameters("SELECT id FROM t WHERE email = 'ops@example.com' AND id = @id");

    REQUIRE(normalized.sql == "SELECT id FROM t WHERE email = 'ops@example.com' AND id = ?");
    REQUIRE(normalized.logicalIndexByName.size() == 1);
}

SCENARIO("a parameter marker without a name is rejected", "[database]") {
    REQUIRE_THROWS_AS(NormalizeNamedParameters("SELECT * FROM t WHERE x = @"), DatabaseException);
    REQUIRE_THROWS_AS(NormalizeNamedParameters("SELECT * FROM t WHERE x = @ AND y = 1"), DatabaseException);
}
