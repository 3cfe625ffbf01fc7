#include "gateway.hpp"

#include <charconv>
#include <cstdint>
#include <exception>
#include <format>
#include <limits>

#include "logging.hpp"

namespace gateway {

namespace {

std::optional<int>
clientIdOf(const httplib::Request& req) {
  auto search = req.path_params.find("id");

  if (search == req.path_params.end()) {
    return std::nullopt;
  }

  return parseClientId(search->second);
}

void
reject(httplib::Response& res, int status) {
  res.status = status;
  res.set_content("", "text/html");
}

}

int
statusFor(UNEXPECTED_CODE code) {
  switch(code) {
    case UNEXPECTED_CODE::NOT_FOUND:
      return 404;
    case UNEXPECTED_CODE::INVALID_INPUT:
    case UNEXPECTED_CODE::LIMIT_EXCEEDED:
      return 422;
    case UNEXPECTED_CODE::STORAGE_UNAVAILABLE:
      return 500;
  }

  return 500;
}

std::optional<int>
parseClientId(std::string_view text) {
  int clientId = 0;

  const auto *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, clientId);

  if(ec != std::errc{} || ptr != end || clientId <= 0) {
    return std::nullopt;
  }

  return clientId;
}

models::TransactionInput
parseTransactionInput(const nlohmann::json& body) {
  models::TransactionInput input;

  if(!body.is_object()) {
    return input;
  }

  if(auto value = body.find("value"); value != body.end()) {
    if(value->is_number_unsigned()) {
      const auto unsignedValue = value->get<std::uint64_t>();

      if(unsignedValue <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        input.value = static_cast<std::int64_t>(unsignedValue);
      }
    } else if(value->is_number_integer()) {
      input.value = value->get<std::int64_t>();
    }
  }

  if(auto type = body.find("type"); type != body.end() && type->is_string()) {
    input.type = type->get<std::string>();
  }

  if(auto description = body.find("description");
     description != body.end() && description->is_string()) {
    input.description = description->get<std::string>();
  }

  return input;
}

std::string
formatTimestamp(models::Timestamp timestamp) {
  return std::format("{0:%FT%TZ}", timestamp);
}

nlohmann::json
toJson(const models::TransactionResponse& response) {
  nlohmann::json data;
  data["limit"] = response.limit;
  data["balance"] = response.balance;
  return data;
}

nlohmann::json
toJson(const models::Statement& statement) {
  nlohmann::json data;
  data["balance"]["total"] = statement.balance.total;
  data["balance"]["limit"] = statement.balance.limit;
  data["balance"]["date"] = formatTimestamp(statement.balance.date);
  data["latest_transactions"] = nlohmann::json::array();

  for (const auto &transaction : statement.latestTransactions) {
    nlohmann::json transactionData;

    transactionData["value"] = transaction.value;
    transactionData["type"] = std::string{static_cast<char>(transaction.type)};
    transactionData["description"] = transaction.description;
    transactionData["executed_at"] = formatTimestamp(transaction.executedAt);

    data["latest_transactions"].push_back(transactionData);
  }

  return data;
}

void
createTransaction(const transactions::Processor& processor,
                  const httplib::Request& req, httplib::Response& res) {
  auto clientId = clientIdOf(req);

  if (!clientId.has_value()) {
    reject(res, 404);
    return;
  }

  nlohmann::json data = nlohmann::json::parse(req.body, nullptr, false);

  if (data.is_discarded()) {
    reject(res, 422);
    return;
  }

  auto result = processor.process(*clientId, parseTransactionInput(data));

  if (!result.has_value()) {
    if(result.error() == UNEXPECTED_CODE::STORAGE_UNAVAILABLE) {
      logging::error(std::format("POST transaction for client {} failed: {}", *clientId, req.body));
    }

    reject(res, statusFor(result.error()));
    return;
  }

  res.status = 200;
  res.set_content(toJson(*result).dump(), "application/json");
}

void
extract(const statement::Builder& builder,
        const httplib::Request& req, httplib::Response& res) {
  auto clientId = clientIdOf(req);

  if (!clientId.has_value()) {
    reject(res, 404);
    return;
  }

  auto result = builder.build(*clientId);

  if (!result.has_value()) {
    if(result.error() == UNEXPECTED_CODE::STORAGE_UNAVAILABLE) {
      logging::error(std::format("statement for client {} failed", *clientId));
    }

    reject(res, statusFor(result.error()));
    return;
  }

  res.status = 200;
  res.set_content(toJson(*result).dump(), "application/json");
}

void
health(const httplib::Request &, httplib::Response &res) {
  res.status = 200;
  res.set_content(nlohmann::json{{"ok", true}}.dump(), "application/json");
}

void
registerRoutes(httplib::Server& svr,
               const transactions::Processor& processor,
               const statement::Builder& builder,
               bool accessLog) {
  svr.Get(R"(/clients/:id/statement)",
          [&builder](const httplib::Request &req, httplib::Response &res) {
            extract(builder, req, res);
          });

  svr.Post(R"(/clients/:id/transactions)",
           [&processor](const httplib::Request &req, httplib::Response &res) {
             createTransaction(processor, req, res);
           });

  svr.Get("/health", health);

  if(accessLog) {
    svr.set_logger([](const httplib::Request &req, const httplib::Response &res) {
      logging::log("HTTP", std::format("{} {} -> {}", req.method, req.path, res.status));
    });
  }

  svr.set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception &e) {
      logging::error(std::format("{} {} raised: {}", req.method, req.path, e.what()));
    } catch (...) {
      logging::error(std::format("{} {} raised an unknown exception", req.method, req.path));
    }

    reject(res, 500);
  });
}

}
