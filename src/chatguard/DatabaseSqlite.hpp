#pragma once

#include "Database.hpp"

struct sqlite3;

class SqliteDatabaseConnection final : public IDatabaseConnection {
public:
    // ":memory:" opens a private in-memory database.
    explicit SqliteDatabaseConnection(const std::string& path);
    ~SqliteDatabaseConnection() override;

    SqliteDatabaseConnection(const SqliteDatabaseConnection&) = delete;
    SqliteDatabaseConnection& operator=(const SqliteDatabaseConnection&) = delete;

    std::unique_ptr<IStatement> Prepare(const std::string& sql) override;
    std::unique_ptr<ITransaction> BeginTransaction() override;
    std::string BackendName() const override;

    // Runs one or more statements that take no parameters.
    void Execute(const std::string& sql);

private:
    sqlite3* db_;
};
