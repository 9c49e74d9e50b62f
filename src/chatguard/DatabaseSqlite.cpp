#include "DatabaseSqlite.hpp"

#include "SqlParameterAdapter.hpp"

#include "easylogging++.h"

#include <sqlite3.h>

namespace {

DatabaseException MakeSqliteError(sqlite3* db, int code, const std::string& context) {
    const char* rawMessage = db ? sqlite3_errmsg(db) : nullptr;
    std::string message = rawMessage ? rawMessage : "unknown sqlite error";
    return DatabaseException("sqlite", code, context + ": " + message);
}

void ExecuteOrThrow(sqlite3* db, const std::string& sql, const std::string& context) {
    char* err = nullptr;
    auto result = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (result != SQLITE_OK) {
        std::string message = err ? err : "unknown sqlite error";
        sqlite3_free(err);
        throw DatabaseException("sqlite", result, context + ": " + message);
    }
}

class SqliteStatement final : public IStatement {
public:
    SqliteStatement(sqlite3* db, const std::string& sql)
        : db_{db}
        , stmt_{nullptr}
        , normalizedSql_(NormalizeNamedParameters(sql)) {
        auto result = sqlite3_prepare_v2(db_, normalizedSql_.sql.c_str(), -1, &stmt_, nullptr);
        if (result != SQLITE_OK) {
            throw MakeSqliteError(db_, result, "prepare failed");
        }
    }

    ~SqliteStatement() override { sqlite3_finalize(stmt_); }

    int BindParameterIndex(const std::string& name) const override {
        auto iter = normalizedSql_.logicalIndexByName.find(name);
        if (iter == normalizedSql_.logicalIndexByName.end()) {
            throw DatabaseException("sqlite", SQLITE_MISUSE, "missing parameter: " + name);
        }

        return iter->second;
    }

    void BindInt(int index, int64_t value) override {
        for (auto position : Positions(index)) {
            if (sqlite3_bind_int64(stmt_, static_cast<int>(position), value) != SQLITE_OK) {
                throw MakeSqliteError(db_, sqlite3_errcode(db_), "bind int failed");
            }
        }
    }

    void BindText(int index, const std::string& value) override {
        for (auto position : Positions(index)) {
            if (sqlite3_bind_text(stmt_, static_cast<int>(position), value.c_str(),
                    static_cast<int>(value.size()), SQLITE_TRANSIENT)
                != SQLITE_OK) {
                throw MakeSqliteError(db_, sqlite3_errcode(db_), "bind text failed");
            }
        }
    }

    StatementStepResult Step() override {
        auto result = sqlite3_step(stmt_);
        if (result == SQLITE_ROW) {
            return StatementStepResult::Row;
        }
        if (result == SQLITE_DONE) {
            return StatementStepResult::Done;
        }
        throw MakeSqliteError(db_, result, "step failed");
    }

    int ColumnInt(int index) const override { return sqlite3_column_int(stmt_, index); }

    std::string ColumnText(int index) const override {
        auto* text = sqlite3_column_text(stmt_, index);
        if (text == nullptr) {
            return {};
        }
        return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
    }

private:
    const std::vector<unsigned int>& Positions(int index) const {
        if (index < 0 || static_cast<size_t>(index) >= normalizedSql_.positionsByLogicalIndex.size()) {
            throw DatabaseException("sqlite", SQLITE_MISUSE, "invalid bind index");
        }
        return normalizedSql_.positionsByLogicalIndex[static_cast<size_t>(index)];
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
    NormalizedSql normalizedSql_;
};

class SqliteTransaction final : public ITransaction {
public:
    explicit SqliteTransaction(sqlite3* db)
        : db_{db}
        , done_{false} {
        ExecuteOrThrow(db_, "BEGIN IMMEDIATE", "transaction begin failed");
    }

    ~SqliteTransaction() override {
        if (done_) {
            return;
        }

        try {
            Rollback();
        } catch (const DatabaseException& e) {
            LOG(ERROR) << "sqlite rollback failed: " << e.what();
        }
    }

    void Commit() override {
        ExecuteOrThrow(db_, "COMMIT", "transaction commit failed");
        done_ = true;
    }

    void Rollback() override {
        done_ = true;
        ExecuteOrThrow(db_, "ROLLBACK", "transaction rollback failed");
    }

private:
    sqlite3* db_;
    bool done_;
};
} // namespace

SqliteDatabaseConnection::SqliteDatabaseConnection(const std::string& path)
    : db_{nullptr} {
    auto result = sqlite3_open_v2(path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (result != SQLITE_OK) {
        auto error = MakeSqliteError(db_, result, "open database " + path + " failed");
        sqlite3_close(db_);
        throw error;
    }

    sqlite3_busy_timeout(db_, 1000);
}

SqliteDatabaseConnection::~SqliteDatabaseConnection() { sqlite3_close(db_); }

std::unique_ptr<IStatement> SqliteDatabaseConnection::Prepare(const std::string& sql) {
    return std::make_unique<SqliteStatement>(db_, sql);
}

std::unique_ptr<ITransaction> SqliteDatabaseConnection::BeginTransaction() {
    return std::make_unique<SqliteTransaction>(db_);
}

std::string SqliteDatabaseConnection::BackendName() const { return "sqlite"; }

void SqliteDatabaseConnection::Execute(const std::string& sql) { ExecuteOrThrow(db_, sql, "execute failed"); }
