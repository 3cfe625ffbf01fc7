#pragma once

#include <functional>
#include <string>

#include "database.hpp"

namespace config {

struct Config {
  std::string
    dbPath = "database.db";
  std::string
    initSql = "init.sql";
  bool
    resetDatabase = true;
  std::string
    host = "0.0.0.0";
  int
    port = 9999;
  int
    threads = 8;
  int
    busyTimeoutMs = 2000;
  bool
    accessLog = true;

  database::Options database() const;
};

using Lookup = std::function<const char *(const char *)>;

// Unset variables keep their defaults. Malformed values throw
// std::invalid_argument.
Config fromLookup(const Lookup& lookup);

Config fromEnvironment();

}
