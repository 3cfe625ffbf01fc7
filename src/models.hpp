#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace models {
  using Timestamp =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

  // Size of the statement window, newest first.
  constexpr std::size_t STATEMENT_WINDOW = 10;

  constexpr std::size_t DESCRIPTION_MAX_LENGTH = 10;

  enum TRANSACTION_TYPE: const unsigned char {
    DEBIT = 'd',
    CREDIT = 'c'
  };

  struct Client {
    int
      id;
    std::int64_t
      limit;
  };

  // Request body as received, before validation. Fields that were missing or
  // had the wrong JSON type are empty.
  struct TransactionInput {
    std::optional<std::int64_t>
      value;
    std::optional<std::string>
      type;
    std::optional<std::string>
      description;
  };

  struct Transaction {
    std::int64_t
      value;
    TRANSACTION_TYPE
      type;
    std::string
      description;
  };

  struct Balance {
    std::int64_t
      total;
    std::int64_t
      limit;
  };

  struct TransactionResponse {
    std::int64_t
      limit;
    std::int64_t
      balance;
  };

  struct BalanceHistory: public Balance {
    Timestamp
      date;
  };

  struct TransactionHistory: public Transaction {
    Timestamp
      executedAt;
  };

  struct Statement {
    BalanceHistory
      balance;
    std::vector<TransactionHistory>
      latestTransactions;
  };
}
