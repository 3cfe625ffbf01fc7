#include "statement.hpp"

#include <chrono>
#include <utility>

namespace statement {

Builder::Builder(database::Options options, const clients::Table& clients)
  : options_(std::move(options)), clients_(clients) {}

std::expected<models::Statement, UNEXPECTED_CODE>
Builder::build(int clientId) const {
  if(!clients_.contains(clientId)) {
    return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
  }

  auto connection = database::getConnection(options_, database::TRANSACTION_MODE::READ);

  if(!connection.has_value()) {
    return std::unexpected(connection.error());
  }

  auto balance = database::getBalance(connection->get(), clientId);

  if(!balance.has_value()) {
    return std::unexpected(balance.error());
  }

  auto transactions = database::getLastTransactionsByClientId(connection->get(), clientId);

  if(!transactions.has_value()) {
    return std::unexpected(transactions.error());
  }

  if(auto error = database::commit(connection->get())) {
    return std::unexpected(*error);
  }

  models::Statement extract;

  extract.balance.total = balance->total;
  extract.balance.limit = balance->limit;
  extract.balance.date =
    std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
  extract.latestTransactions = std::move(*transactions);

  return extract;
}

}
