#pragma once

#include <boost/optional.hpp>

#include <string>

class IDatabaseConnection;

// Persists sealed secrets by name. Plaintext values are refused.
class SecretStore {
public:
    explicit SecretStore(IDatabaseConnection& db);

    void Store(const std::string& name, const std::string& sealedValue);
    boost::optional<std::string> Load(const std::string& name);
    bool Remove(const std::string& name);

private:
    IDatabaseConnection& db_;
};
