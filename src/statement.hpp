#pragma once

#include <expected>

#include "clients.hpp"
#include "database.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace statement {

class Builder {
public:
  Builder(database::Options options, const clients::Table& clients);

  // Balance, limit and the newest transactions of the client, all read from
  // one snapshot. Does not take the client's row lock.
  std::expected<models::Statement, UNEXPECTED_CODE>
  build(int clientId) const;

private:
  database::Options options_;
  const clients::Table& clients_;
};

}
