#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "database.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace clients {

// Provisioned clients, loaded once at start-up. Membership and limits never
// change afterwards; each client carries the mutex that serializes writes to
// its ledger row.
class Table {
public:
  explicit Table(const std::vector<models::Client>& clients);

  Table(const Table&) = delete;
  Table& operator=(const Table&) = delete;

  bool contains(int clientId) const;

  std::optional<std::int64_t> limitOf(int clientId) const;

  // Throws std::out_of_range for an identity that is not provisioned.
  std::unique_lock<std::mutex> lock(int clientId) const;

  std::vector<int> ids() const;

  std::size_t size() const { return rows_.size(); }

private:
  struct Row {
    explicit Row(std::int64_t limit): limit(limit) {}

    const std::int64_t limit;
    mutable std::mutex mutex;
  };

  std::map<int, Row> rows_;
};

std::expected<std::unique_ptr<Table>, UNEXPECTED_CODE>
load(const database::Options& options);

}
