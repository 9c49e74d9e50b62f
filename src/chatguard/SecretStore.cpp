#include "SecretStore.hpp"

#include "Database.hpp"
#include "SecretManager.hpp"

#include <chrono>

SecretStore::SecretStore(IDatabaseConnection& db)
    : db_{db} {}

void SecretStore::Store(const std::string& name, const std::string& sealedValue) {
    if (!SecretManager::LooksSealed(sealedValue)) {
        throw IntegrityError("refusing to persist an unsealed value for " + name);
    }

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    TransactionScope transaction{db_.BeginTransaction()};

    StatementHandle stmt{db_.Prepare("INSERT OR REPLACE INTO sealed_secret (name, sealed_value, updated_at) "
                                     "VALUES (@name, @sealed_value, @updated_at)")};
    stmt.BindText("@name", name);
    stmt.BindText("@sealed_value", sealedValue);
    stmt.BindInt("@updated_at", now);
    stmt.ExpectDone("store sealed secret");

    transaction.Commit();
}

boost::optional<std::string> SecretStore::Load(const std::string& name) {
    StatementHandle stmt{db_.Prepare("SELECT sealed_value FROM sealed_secret WHERE name = @name")};
    stmt.BindText("@name", name);

    if (stmt.Step() != StatementStepResult::Row) {
        return boost::none;
    }

    return stmt->ColumnText(0);
}

bool SecretStore::Remove(const std::string& name) {
    if (!Load(name)) {
        return false;
    }

    StatementHandle stmt{db_.Prepare("DELETE FROM sealed_secret WHERE name = @name")};
    stmt.BindText("@name", name);
    stmt.ExpectDone("remove sealed secret");
    return true;
}
