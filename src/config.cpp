#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <string_view>

namespace config {

namespace {

int
intOr(const Lookup& lookup, const char *name, int fallback, int minimum) {
  const char *raw = lookup(name);

  if(raw == nullptr || *raw == '\0') {
    return fallback;
  }

  const std::string_view text{raw};
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);

  if(ec != std::errc{} || ptr != text.data() + text.size() || value < minimum) {
    throw std::invalid_argument(std::format("{}={} is not an integer >= {}", name, text, minimum));
  }

  return value;
}

bool
boolOr(const Lookup& lookup, const char *name, bool fallback) {
  const char *raw = lookup(name);

  if(raw == nullptr || *raw == '\0') {
    return fallback;
  }

  const std::string_view text{raw};

  if(text == "1" || text == "true" || text == "yes") {
    return true;
  }

  if(text == "0" || text == "false" || text == "no") {
    return false;
  }

  throw std::invalid_argument(std::format("{}={} is not a boolean", name, text));
}

std::string
stringOr(const Lookup& lookup, const char *name, const std::string& fallback) {
  const char *raw = lookup(name);
  return raw != nullptr && *raw != '\0' ? std::string{raw} : fallback;
}

}

database::Options Config::database() const {
  return database::Options{dbPath, busyTimeoutMs};
}

Config fromLookup(const Lookup& lookup) {
  Config config;

  config.dbPath = stringOr(lookup, "LEDGER_DB_PATH", config.dbPath);
  config.initSql = stringOr(lookup, "LEDGER_INIT_SQL", config.initSql);
  config.resetDatabase = boolOr(lookup, "LEDGER_RESET_DB", config.resetDatabase);
  config.host = stringOr(lookup, "LEDGER_HOST", config.host);
  config.port = intOr(lookup, "LEDGER_PORT", config.port, 1);
  config.threads = intOr(lookup, "LEDGER_THREADS", config.threads, 1);
  config.busyTimeoutMs = intOr(lookup, "LEDGER_BUSY_TIMEOUT_MS", config.busyTimeoutMs, 0);
  config.accessLog = boolOr(lookup, "LEDGER_ACCESS_LOG", config.accessLog);

  if(config.port > 65535) {
    throw std::invalid_argument(std::format("LEDGER_PORT={} is out of range", config.port));
  }

  return config;
}

Config fromEnvironment() {
  return fromLookup([](const char *name) { return std::getenv(name); });
}

}
