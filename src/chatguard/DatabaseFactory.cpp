#include "DatabaseFactory.hpp"

#include "ChatGuardConfig.hpp"
#include "DatabaseBootstrap.hpp"
#include "DatabaseSqlite.hpp"

#include "easylogging++.h"

#include <boost/filesystem/operations.hpp>

#include <sstream>
#include <vector>

namespace {
std::string Join(const std::vector<std::string>& items) {
    if (items.empty()) {
        return "none";
    }

    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << items[i];
    }
    return out.str();
}

void LogSchemaStatus(const IDatabaseConnection& db, const std::string& path, const SchemaValidationResult& result) {
    LOG(INFO) << "Secret store opened: " << db.BackendName() << " at " << path;
    LOG(INFO) << "Secret store schema version: " << result.currentVersion
              << " (required " << result.requiredVersion << ")";
    LOG(INFO) << "Migrations applied at startup: " << Join(result.appliedMigrations);
}
} // namespace

std::unique_ptr<IDatabaseConnection> CreateDatabaseConnection(const ChatGuardConfig& config) {
    if (config.secretStorePath.empty()) {
        throw DatabaseException("database", 0, "secret_store_path must be set");
    }

    const boost::filesystem::path storePath{config.secretStorePath};
    if (storePath.has_parent_path()) {
        boost::filesystem::create_directories(storePath.parent_path());
    }

    auto connection = std::make_unique<SqliteDatabaseConnection>(config.secretStorePath);

    const auto validation = BootstrapDatabaseSchema(*connection);
    LogSchemaStatus(*connection, config.secretStorePath, validation);

    return std::move(connection);
}
