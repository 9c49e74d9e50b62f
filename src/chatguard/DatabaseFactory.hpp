#pragma once

#include "Database.hpp"

#include <memory>

struct ChatGuardConfig;

// Opens the secret store database named by the configuration and brings its
// schema up to date.
std::unique_ptr<IDatabaseConnection> CreateDatabaseConnection(const ChatGuardConfig& config);
