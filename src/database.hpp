#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "models.hpp"
#include "unexpected_codes.hpp"

namespace database {

struct Connection;

enum class TRANSACTION_MODE {
  NONE,
  // Deferred transaction: every read inside it sees the same snapshot.
  READ,
  // BEGIN IMMEDIATE: takes the write lock up front.
  WRITE
};

struct Options {
  std::string
    path = "database.db";
  int
    busyTimeoutMs = 2000;
};

using ConnectionPtr = std::unique_ptr<Connection, void(*)(Connection*)>;

//Database specific

// Opens a connection and, unless mode is NONE, begins a transaction on it.
// Destroying the handle rolls back whatever was not committed.
std::expected<ConnectionPtr, UNEXPECTED_CODE>
getConnection(const Options& options, TRANSACTION_MODE mode = TRANSACTION_MODE::NONE);

std::optional<UNEXPECTED_CODE>
run_stmt(Connection*, const char *);

std::optional<UNEXPECTED_CODE>
commit(Connection* connection);

// Recreates the database from the provisioning script. Throws
// std::runtime_error when the script or the database cannot be used.
void
provision(const Options& options, const std::filesystem::path& initSql, bool reset);

//Model operations

std::expected<std::vector<models::Client>, UNEXPECTED_CODE>
getClients(Connection* connection);

std::expected<models::Balance, UNEXPECTED_CODE>
getBalance(Connection* connection, int clientId);

std::expected<std::vector<models::TransactionHistory>, UNEXPECTED_CODE>
getLastTransactionsByClientId(Connection* connection, int clientId,
                              std::size_t count = models::STATEMENT_WINDOW);

std::optional<UNEXPECTED_CODE>
updateBalance(Connection* connection, int clientId, std::int64_t balance);

std::optional<UNEXPECTED_CODE>
insertTransaction(Connection* connection, int clientId,
                  const models::Transaction& transaction, models::Timestamp executedAt);

// Signed sum of every logged transaction of the client.
std::expected<std::int64_t, UNEXPECTED_CODE>
sumTransactionsByClientId(Connection* connection, int clientId);

}
