#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "httplib.h"
#include "nlohmann/json.hpp"

#include "models.hpp"
#include "statement.hpp"
#include "transactions.hpp"
#include "unexpected_codes.hpp"

namespace gateway {

int
statusFor(UNEXPECTED_CODE code);

// Client identity from the path. Anything that is not a positive integer has
// no client behind it.
std::optional<int>
parseClientId(std::string_view text);

// Keeps only fields of the expected JSON type; value must be an integer that
// fits in 64 bits.
models::TransactionInput
parseTransactionInput(const nlohmann::json& body);

// ISO-8601, UTC, millisecond precision.
std::string
formatTimestamp(models::Timestamp timestamp);

nlohmann::json
toJson(const models::TransactionResponse& response);

nlohmann::json
toJson(const models::Statement& statement);

void
createTransaction(const transactions::Processor& processor,
                  const httplib::Request& req, httplib::Response& res);

void
extract(const statement::Builder& builder,
        const httplib::Request& req, httplib::Response& res);

void
health(const httplib::Request& req, httplib::Response& res);

void
registerRoutes(httplib::Server& svr,
               const transactions::Processor& processor,
               const statement::Builder& builder,
               bool accessLog = true);

}
