#include "catch.hpp"

#include <boost/optional/optional_io.hpp>

#include "DatabaseBootstrap.hpp"
#include "DatabaseSqlite.hpp"
#include "SecretManager.hpp"
#include "SecretStore.hpp"

SCENARIO("a fresh database is migrated to the current schema", "[database]") {
    SqliteDatabaseConnection db{":memory:"};

    auto first = BootstrapDatabaseSchema(db);
    REQUIRE(first.appliedMigrations.size() == 1);
    REQUIRE(first.currentVersion == first.requiredVersion);

    WHEN("the schema is bootstrapped again") {
        auto second = BootstrapDatabaseSchema(db);

        THEN("nothing is reapplied") {
            REQUIRE(second.appliedMigrations.empty());
            REQUIRE(second.currentVersion == first.currentVersion);
        }
    }
}

SCENARIO("an empty database does not pass schema validation", "[database]") {
    SqliteDatabaseConnection db{":memory:"};

    REQUIRE_THROWS_AS(ValidateDatabaseSchemaOrThrow(db), DatabaseException);
}

SCENARIO("sealed secrets are persisted by name", "[database][secrets]") {
    SqliteDatabaseConnection db{":memory:"};
    BootstrapDatabaseSchema(db);

    SecretManager manager{std::vector<unsigned char>(SecretManager::KEY_SIZE, 5)};
    SecretStore store{db};

    GIVEN("a stored credential") {
        const auto sealed = manager.Seal("platform-token");
        store.Store("platform_credential", sealed);

        THEN("it loads back sealed") {
            auto loaded = store.Load("platform_credential");
            REQUIRE(loaded);
            REQUIRE(*loaded == sealed);
            REQUIRE(manager.Unseal(*loaded) == "platform-token");
        }

        WHEN("it is stored again") {
            const auto resealed = manager.Seal("rotated-token");
            store.Store("platform_credential", resealed);

            THEN("the newer value replaces the old one") {
                REQUIRE(*store.Load("platform_credential") == resealed);
            }
        }

        WHEN("it is removed") {
            REQUIRE(store.Remove("platform_credential"));

            THEN("it is gone") {
                REQUIRE_FALSE(store.Load("platform_credential"));
                REQUIRE_FALSE(store.Remove("platform_credential"));
            }
        }
    }

    GIVEN("a plaintext value") {
        THEN("the store refuses it") {
            REQUIRE_THROWS_AS(store.Store("platform_credential", "platform-token"), IntegrityError);
            REQUIRE_FALSE(store.Load("platform_credential"));
        }
    }
}
