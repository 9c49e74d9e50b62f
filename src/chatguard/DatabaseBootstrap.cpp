#include "DatabaseBootstrap.hpp"

#include "Database.hpp"

#include <sstream>

namespace {
constexpr int kRequiredSchemaVersion = 1;

struct Migration {
    int version;
    std::string name;
    std::vector<std::string> statements;
};

const std::vector<Migration>& MigrationCatalog() {
    static const std::vector<Migration> catalog = {
        {1, "V001__baseline",
            {
                "CREATE TABLE IF NOT EXISTS schema_version (version INTEGER NOT NULL)",
                "CREATE TABLE IF NOT EXISTS sealed_secret ("
                "name TEXT PRIMARY KEY NOT NULL, "
                "sealed_value TEXT NOT NULL, "
                "updated_at INTEGER NOT NULL)",
            }},
    };

    return catalog;
}

bool TableExists(IDatabaseConnection& db, const std::string& tableName) {
    StatementHandle stmt{db.Prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = @table_name")};
    stmt.BindText("@table_name", tableName);
    return stmt.Step() == StatementStepResult::Row;
}

int ReadSchemaVersion(IDatabaseConnection& db) {
    if (!TableExists(db, "schema_version")) {
        return 0;
    }

    StatementHandle stmt{db.Prepare("SELECT MAX(version) FROM schema_version")};
    if (stmt.Step() != StatementStepResult::Row) {
        return 0;
    }

    return stmt->ColumnInt(0);
}

void WriteSchemaVersion(IDatabaseConnection& db, int version) {
    StatementHandle clear{db.Prepare("DELETE FROM schema_version")};
    clear.ExpectDone("clear schema_version");

    StatementHandle insert{db.Prepare("INSERT INTO schema_version (version) VALUES (@version)")};
    insert.BindInt("@version", version);
    insert.ExpectDone("write schema_version");
}

std::string Join(const std::vector<std::string>& items) {
    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << items[i];
    }
    return out.str();
}

} // namespace

SchemaValidationResult BootstrapDatabaseSchema(IDatabaseConnection& db) {
    std::vector<std::string> applied;
    const int startVersion = ReadSchemaVersion(db);

    for (const auto& migration : MigrationCatalog()) {
        if (migration.version <= startVersion) {
            continue;
        }

        TransactionScope transaction{db.BeginTransaction()};
        for (const auto& sql : migration.statements) {
            StatementHandle stmt{db.Prepare(sql)};
            stmt.ExpectDone(migration.name);
        }
        WriteSchemaVersion(db, migration.version);
        transaction.Commit();

        applied.push_back(migration.name);
    }

    auto result = ValidateDatabaseSchemaOrThrow(db);
    result.appliedMigrations = std::move(applied);
    return result;
}

SchemaValidationResult ValidateDatabaseSchemaOrThrow(IDatabaseConnection& db) {
    const auto& migrations = MigrationCatalog();
    const int latestKnownVersion = migrations.back().version;

    if (!TableExists(db, "schema_version")) {
        throw DatabaseException(db.BackendName(), 0, "schema_version table is missing");
    }

    const int currentVersion = ReadSchemaVersion(db);

    if (currentVersion > latestKnownVersion) {
        throw DatabaseException(db.BackendName(), 0,
            "database schema version " + std::to_string(currentVersion)
                + " is newer than this binary supports (latest known migration: "
                + std::to_string(latestKnownVersion) + "). Deploy a newer chatguard binary");
    }

    std::vector<std::string> pending;
    for (const auto& migration : migrations) {
        if (migration.version > currentVersion) {
            pending.push_back(migration.name);
        }
    }

    if (currentVersion < kRequiredSchemaVersion) {
        throw DatabaseException(db.BackendName(), 0,
            "database schema version " + std::to_string(currentVersion) + " is below required "
                + std::to_string(kRequiredSchemaVersion) + ". Pending migrations: " + Join(pending));
    }

    SchemaValidationResult result;
    result.currentVersion = currentVersion;
    result.requiredVersion = kRequiredSchemaVersion;
    return result;
}
