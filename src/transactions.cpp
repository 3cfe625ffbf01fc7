#include "transactions.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <limits>
#include <utility>

#include "logging.hpp"

namespace transactions {

std::optional<std::size_t>
countCharacters(std::string_view utf8) {
  std::size_t count = 0;

  for(std::size_t i = 0; i < utf8.size(); ++count) {
    const auto lead = static_cast<unsigned char>(utf8[i]);

    // Allowed range of the second byte; the rest are plain continuations.
    std::size_t length;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;

    if(lead < 0x80) {
      length = 1;
    } else if(lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if(lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      if(lead == 0xE0) {
        low = 0xA0;
      } else if(lead == 0xED) {
        high = 0x9F;
      }
    } else if(lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      if(lead == 0xF0) {
        low = 0x90;
      } else if(lead == 0xF4) {
        high = 0x8F;
      }
    } else {
      return std::nullopt;
    }

    if(i + length > utf8.size()) {
      return std::nullopt;
    }

    for(std::size_t j = 1; j < length; ++j) {
      const auto byte = static_cast<unsigned char>(utf8[i + j]);
      const auto min = j == 1 ? low : static_cast<unsigned char>(0x80);
      const auto max = j == 1 ? high : static_cast<unsigned char>(0xBF);

      if(byte < min || byte > max) {
        return std::nullopt;
      }
    }

    i += length;
  }

  return count;
}

std::expected<models::Transaction, UNEXPECTED_CODE>
parse(const models::TransactionInput& input) {
  if(!input.value.has_value() || *input.value <= 0) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  if(!input.type.has_value() || input.type->size() != 1) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  const auto type = static_cast<models::TRANSACTION_TYPE>(input.type->front());

  if (type != models::TRANSACTION_TYPE::DEBIT &&
      type != models::TRANSACTION_TYPE::CREDIT) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  if(!input.description.has_value()) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  // No C0 controls or DEL. SQLite text functions stop at NUL.
  for(const char c: *input.description) {
    const auto byte = static_cast<unsigned char>(c);

    if(byte < 0x20 || byte == 0x7F) {
      return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
    }
  }

  const auto length = countCharacters(*input.description);

  if(!length.has_value() || *length == 0 || *length > models::DESCRIPTION_MAX_LENGTH) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
  }

  return models::Transaction{*input.value, type, *input.description};
}

std::expected<std::int64_t, UNEXPECTED_CODE>
applyToBalance(const models::Balance& balance, const models::Transaction& transaction) {
  if(transaction.type == models::TRANSACTION_TYPE::CREDIT) {
    if(balance.total > std::numeric_limits<std::int64_t>::max() - transaction.value) {
      return std::unexpected(UNEXPECTED_CODE::INVALID_INPUT);
    }

    return balance.total + transaction.value;
  }

  // Same as total - value < -limit, without overflowing on either side.
  if(balance.total < transaction.value - balance.limit) {
    return std::unexpected(UNEXPECTED_CODE::LIMIT_EXCEEDED);
  }

  return balance.total - transaction.value;
}

Processor::Processor(database::Options options, const clients::Table& clients)
  : options_(std::move(options)), clients_(clients) {}

std::expected<models::TransactionResponse, UNEXPECTED_CODE>
Processor::process(int clientId, const models::TransactionInput& input) const {
  if(!clients_.contains(clientId)) {
    return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
  }

  auto transaction = parse(input);

  if(!transaction.has_value()) {
    return std::unexpected(transaction.error());
  }

  return apply(clientId, *transaction);
}

std::expected<models::TransactionResponse, UNEXPECTED_CODE>
Processor::apply(int clientId, const models::Transaction& transaction) const {
  if(!clients_.contains(clientId)) {
    return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
  }

  auto rowLock = clients_.lock(clientId);

  auto connection = database::getConnection(options_, database::TRANSACTION_MODE::WRITE);

  if(!connection.has_value()) {
    return std::unexpected(connection.error());
  }

  auto balance = database::getBalance(connection->get(), clientId);

  if(!balance.has_value()) {
    return std::unexpected(balance.error());
  }

  auto newBalance = applyToBalance(*balance, transaction);

  if(!newBalance.has_value()) {
    return std::unexpected(newBalance.error());
  }

  auto latest = database::getLastTransactionsByClientId(connection->get(), clientId, 1);

  if(!latest.has_value()) {
    return std::unexpected(latest.error());
  }

  // Never older than the client's previous entry, even if the wall clock
  // stepped back.
  auto executedAt =
    std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());

  if(!latest->empty()) {
    executedAt = std::max(executedAt, latest->front().executedAt);
  }

  if(auto error = database::updateBalance(connection->get(), clientId, *newBalance)) {
    logging::error(std::format("balance update of client {} failed: {}", clientId, to_string(*error)));
    return std::unexpected(*error);
  }

  if(auto error = database::insertTransaction(connection->get(), clientId, transaction, executedAt)) {
    logging::error(std::format("transaction insert of client {} failed: {}", clientId, to_string(*error)));
    return std::unexpected(*error);
  }

  if(auto error = database::commit(connection->get())) {
    logging::error(std::format("commit of client {} failed: {}", clientId, to_string(*error)));
    return std::unexpected(*error);
  }

  return models::TransactionResponse{balance->limit, *newBalance};
}

}
