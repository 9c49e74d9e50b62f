#pragma once

#include <string>
#include <vector>

class IDatabaseConnection;

struct SchemaValidationResult {
    int currentVersion = 0;
    int requiredVersion = 0;
    std::vector<std::string> appliedMigrations;
};

// Applies every migration newer than the stored schema version, then checks
// the result. Throws DatabaseException when the database was written by a
// newer binary or the schema is still incomplete.
SchemaValidationResult BootstrapDatabaseSchema(IDatabaseConnection& db);

SchemaValidationResult ValidateDatabaseSchemaOrThrow(IDatabaseConnection& db);
