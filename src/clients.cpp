#include "clients.hpp"

#include <format>

#include "logging.hpp"

namespace clients {

Table::Table(const std::vector<models::Client>& clients) {
  for(const auto& client: clients) {
    rows_.try_emplace(client.id, client.limit);
  }
}

bool Table::contains(int clientId) const {
  return rows_.contains(clientId);
}

std::optional<std::int64_t> Table::limitOf(int clientId) const {
  auto search = rows_.find(clientId);

  if(search == rows_.end()) {
    return std::nullopt;
  }

  return search->second.limit;
}

std::unique_lock<std::mutex> Table::lock(int clientId) const {
  return std::unique_lock<std::mutex>(rows_.at(clientId).mutex);
}

std::vector<int> Table::ids() const {
  std::vector<int> ids;
  ids.reserve(rows_.size());

  for(const auto& [id, row]: rows_) {
    ids.push_back(id);
  }

  return ids;
}

std::expected<std::unique_ptr<Table>, UNEXPECTED_CODE>
load(const database::Options& options) {
  auto connection = database::getConnection(options, database::TRANSACTION_MODE::READ);

  if(!connection.has_value()) {
    return std::unexpected(connection.error());
  }

  auto clients = database::getClients(connection->get());

  if(!clients.has_value()) {
    return std::unexpected(clients.error());
  }

  if(auto error = database::commit(connection->get())) {
    return std::unexpected(*error);
  }

  for(const auto& client: *clients) {
    logging::info(std::format("client {} provisioned with limit {}", client.id, client.limit));
  }

  return std::make_unique<Table>(*clients);
}

}
