#include "database.hpp"
#include "logging.hpp"
#include "sqlite3.h"

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace database {

struct Connection {
  sqlite3 *db = nullptr;
  sqlite3_stmt* stmt = nullptr;
  int rc = SQLITE_OK;

  bool ok() const {
    return rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE;
  }

  template<typename Functor>
  void prepare(Functor functor) {
    if(stmt != nullptr) {
      sqlite3_finalize(stmt);
      stmt = nullptr;
    }
    rc = SQLITE_OK;
    command(functor);
  }

  // Runs each functor in order and stops at the first one that fails.
  template<typename... Functors>
  void command(Functors&&... functors) {
    ([&]{
      if(!ok()) {
        return;
      }

      rc = functors();

      if(!ok()) {
        logging::log("SQLITE3_ERROR", sqlite3_errmsg(db));
      }
    } (), ...);
  }
};

namespace {

void deleteConnection(Connection* connection) {
  if(connection->stmt != nullptr) {
    sqlite3_finalize(connection->stmt);
    connection->stmt = nullptr;
  }

  if(connection->db != nullptr && sqlite3_get_autocommit(connection->db) == 0) {
    if(sqlite3_exec(connection->db, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
      logging::log("SQLITE3_ERROR ROLLBACK", sqlite3_errmsg(connection->db));
    }
  }

  if(sqlite3_close(connection->db) != SQLITE_OK) {
    logging::log("SQLITE3_ERROR DELETE", sqlite3_errmsg(connection->db));
  }

  delete connection;
}

std::expected<ConnectionPtr, UNEXPECTED_CODE>
openDatabase(const Options& options, int flags) {
  ConnectionPtr connection(new Connection{}, deleteConnection);

  connection->rc = sqlite3_open_v2(options.path.c_str(), &connection->db, flags, nullptr);

  if(connection->rc != SQLITE_OK) {
    logging::log("SQLITE3_ERROR",
                 std::format("couldn't open {}: {}", options.path,
                             connection->db != nullptr ? sqlite3_errmsg(connection->db) : "out of memory"));
    return std::unexpected(UNEXPECTED_CODE::STORAGE_UNAVAILABLE);
  }

  sqlite3_busy_timeout(connection->db, options.busyTimeoutMs);

  return connection;
}

}

std::expected<ConnectionPtr, UNEXPECTED_CODE>
getConnection(const Options& options, TRANSACTION_MODE mode) {
  auto connection = openDatabase(options, SQLITE_OPEN_READWRITE | SQLITE_OPEN_NOMUTEX);

  if(!connection.has_value()) {
    return connection;
  }

  const char *begin = nullptr;

  switch(mode) {
    case TRANSACTION_MODE::NONE:
      return connection;
    case TRANSACTION_MODE::READ:
      begin = "BEGIN";
      break;
    case TRANSACTION_MODE::WRITE:
      begin = "BEGIN IMMEDIATE";
      break;
  }

  if(run_stmt(connection->get(), begin).has_value()) {
    return std::unexpected(UNEXPECTED_CODE::STORAGE_UNAVAILABLE);
  }

  return connection;
}

std::optional<UNEXPECTED_CODE>
run_stmt(Connection *connection, const char *sql) {
  char *zErrMsg = nullptr;

  connection->rc = sqlite3_exec(connection->db, sql, nullptr, nullptr, &zErrMsg);

  if (connection->rc != SQLITE_OK) {
    logging::log("SQLITE3_ERROR", zErrMsg != nullptr ? zErrMsg : sqlite3_errstr(connection->rc));
    sqlite3_free(zErrMsg);
    return UNEXPECTED_CODE::STORAGE_UNAVAILABLE;
  }

  return std::nullopt;
}

std::optional<UNEXPECTED_CODE>
commit(Connection *connection) {
  if(connection->stmt != nullptr) {
    sqlite3_finalize(connection->stmt);
    connection->stmt = nullptr;
  }

  return run_stmt(connection, "COMMIT");
}

void
provision(const Options& options, const std::filesystem::path& initSql, bool reset) {
  namespace fs = std::filesystem;

  std::ifstream s{initSql};

  if(!s.is_open()) {
    throw std::runtime_error(std::format("couldn't read provisioning script {}", initSql.string()));
  }

  if(reset) {
    for(const char *suffix: {"", "-wal", "-shm"}) {
      fs::remove(options.path + suffix);
    }
  }

  auto connection = openDatabase(options, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

  if(!connection.has_value()) {
    throw std::runtime_error(std::format("DATABASE {} couldn't be created", options.path));
  }

  std::stringstream sql;

  sql << s.rdbuf();

  if(run_stmt(connection->get(), sql.str().c_str()).has_value()) {
    throw std::runtime_error(std::format("provisioning script {} failed", initSql.string()));
  }
}

std::expected<std::vector<models::Client>, UNEXPECTED_CODE>
getClients(Connection* connection) {

    auto sql = "SELECT id, limit_cents FROM clients ORDER BY id";

    connection->prepare([&]() {
      return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
    });

    connection->command([&]() { return sqlite3_step(connection->stmt); });

    std::vector<models::Client> clients;

    while(connection->rc == SQLITE_ROW) {
      clients.push_back(models::Client{
        sqlite3_column_int(connection->stmt, 0),
        sqlite3_column_int64(connection->stmt, 1)
      });

      connection->command([&]() { return sqlite3_step(connection->stmt); });
    }

    if(connection->rc == SQLITE_DONE) {
      return clients;
    }

    return std::unexpected(UNEXPECTED_CODE::STORAGE_UNAVAILABLE);
}

std::expected<models::Balance, UNEXPECTED_CODE>
getBalance(Connection *connection, int clientId) {

  auto sql = R"(
    SELECT balance_cents, limit_cents
    FROM clients
    WHERE id = ?
    LIMIT 1)";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command(
      [&]() { return sqlite3_bind_int(connection->stmt, 1, clientId); },
      [&]() { return sqlite3_step(connection->stmt); }
  );

  if (connection->rc == SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
  }

  if (connection->rc == SQLITE_ROW) {
    models::Balance balance;

    balance.total = sqlite3_column_int64(connection->stmt, 0);
    balance.limit = sqlite3_column_int64(connection->stmt, 1);

    return balance;
  }

  return std::unexpected(UNEXPECTED_CODE::STORAGE_UNAVAILABLE);
}

std::expected<std::vector<models::TransactionHistory>, UNEXPECTED_CODE>
getLastTransactionsByClientId(Connection* connection, int clientId, std::size_t count) {

    auto sql = R"(
      SELECT value_cents, type, description, executed_at
      FROM transactions
      WHERE client_id = ?
      ORDER BY executed_at DESC, id DESC
      LIMIT ?
    )";

    connection->prepare([&]() {
      return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
    });

    connection->command(
        [&]() { return sqlite3_bind_int(connection->stmt, 1, clientId); },
        [&]() { return sqlite3_bind_int64(connection->stmt, 2, static_cast<sqlite3_int64>(count)); },
        [&]() { return sqlite3_step(connection->stmt); }
    );

    std::vector<models::TransactionHistory> transactionHistory;

    while(connection->rc == SQLITE_ROW) {
      const auto *type = sqlite3_column_text(connection->stmt, 1);
      const auto *description = sqlite3_column_text(connection->stmt, 2);

      if(type == nullptr || description == nullptr) {
        logging::log("SQLITE3_ERROR", std::format("NULL column in transactions of client {}", clientId));
        return std::unexpected(UNEXPECTED_CODE::STORAGE_UNAVAILABLE);
      }

      transactionHistory.push_back(models::TransactionHistory{
        {
          sqlite3_column_int64(connection->stmt, 0),
          static_cast<models::TRANSACTION_TYPE>(type[0]),
          std::string{reinterpret_cast<const char *>(description),
                      static_cast<std::size_t>(sqlite3_column_bytes(connection->stmt, 2))},
        },
        models::Timestamp{std::chrono::milliseconds{sqlite3_column_int64(connection->stmt, 3)}}
      });

      connection->command([&]() {
        return sqlite3_step(connection->stmt);
      });
    }

    if(connection->rc == SQLITE_DONE) {
      return transactionHistory;
    }

    return std::unexpected(UNEXPECTED_CODE::STORAGE_UNAVAILABLE);
}

std::optional<UNEXPECTED_CODE>
updateBalance(Connection* connection, int clientId, std::int64_t balance) {

    auto sql = "UPDATE clients SET balance_cents = ? WHERE id = ?";

    connection->prepare([&]() {
      return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
    });

    connection->command(
      [&]() { return sqlite3_bind_int64(connection->stmt, 1, balance); },
      [&]() { return sqlite3_bind_int(connection->stmt, 2, clientId); },
      [&]() { return sqlite3_step(connection->stmt); }
    );

    if(connection->rc != SQLITE_DONE) {
      return UNEXPECTED_CODE::STORAGE_UNAVAILABLE;
    }

    if(sqlite3_changes(connection->db) != 1) {
      return UNEXPECTED_CODE::NOT_FOUND;
    }

    return std::nullopt;
}

std::optional<UNEXPECTED_CODE>
insertTransaction(Connection* connection, int clientId,
                  const models::Transaction& transaction, models::Timestamp executedAt) {

    auto sql = R"(
      INSERT INTO transactions(client_id, value_cents, type, description, executed_at)
      values(?, ?, ?, ?, ?)
    )";

    connection->prepare([&]() {
      return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
    });

    const std::string type{static_cast<char>(transaction.type)};

    connection->command(
        [&]() { return sqlite3_bind_int(connection->stmt, 1, clientId); },
        [&]() { return sqlite3_bind_int64(connection->stmt, 2, transaction.value); },
        [&]() { return sqlite3_bind_text(connection->stmt, 3, type.c_str(), 1, SQLITE_STATIC); },
        [&]() {
            return sqlite3_bind_text(connection->stmt, 4, transaction.description.c_str(),
                                     static_cast<int>(transaction.description.size()), SQLITE_STATIC);
        },
        [&]() {
            return sqlite3_bind_int64(connection->stmt, 5, executedAt.time_since_epoch().count());
        },
        [&]() { return sqlite3_step(connection->stmt); }
    );

    if(connection->rc == SQLITE_DONE) {
      return std::nullopt;
    }

    return UNEXPECTED_CODE::STORAGE_UNAVAILABLE;
}

std::expected<std::int64_t, UNEXPECTED_CODE>
sumTransactionsByClientId(Connection* connection, int clientId) {

    auto sql = R"(
      SELECT COALESCE(SUM(CASE type WHEN 'c' THEN value_cents ELSE -value_cents END), 0)
      FROM transactions
      WHERE client_id = ?
    )";

    connection->prepare([&]() {
      return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
    });

    connection->command(
        [&]() { return sqlite3_bind_int(connection->stmt, 1, clientId); },
        [&]() { return sqlite3_step(connection->stmt); }
    );

    if(connection->rc == SQLITE_ROW) {
      return sqlite3_column_int64(connection->stmt, 0);
    }

    return std::unexpected(UNEXPECTED_CODE::STORAGE_UNAVAILABLE);
}

}
