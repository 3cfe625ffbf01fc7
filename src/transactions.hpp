#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>

#include "clients.hpp"
#include "database.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace transactions {

// Number of Unicode code points in a UTF-8 string, or nothing when the string
// is not valid UTF-8.
std::optional<std::size_t>
countCharacters(std::string_view utf8);

// Checks value, type and description in that order. Pure, touches no storage.
std::expected<models::Transaction, UNEXPECTED_CODE>
parse(const models::TransactionInput& input);

// Balance after applying the transaction, or LIMIT_EXCEEDED when a debit
// would take the balance below -limit.
std::expected<std::int64_t, UNEXPECTED_CODE>
applyToBalance(const models::Balance& balance, const models::Transaction& transaction);

class Processor {
public:
  Processor(database::Options options, const clients::Table& clients);

  // Validates the request and applies it. Rejections leave the ledger as it
  // was.
  std::expected<models::TransactionResponse, UNEXPECTED_CODE>
  process(int clientId, const models::TransactionInput& input) const;

  // Balance check, balance update and log append as one atomic unit, under
  // the client's row lock.
  std::expected<models::TransactionResponse, UNEXPECTED_CODE>
  apply(int clientId, const models::Transaction& transaction) const;

private:
  database::Options options_;
  const clients::Table& clients_;
};

}
