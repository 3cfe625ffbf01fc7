#pragma once

enum class UNEXPECTED_CODE {
  NOT_FOUND,
  INVALID_INPUT,
  LIMIT_EXCEEDED,
  STORAGE_UNAVAILABLE
};

constexpr const char *
to_string(UNEXPECTED_CODE code) {
  switch(code) {
    case UNEXPECTED_CODE::NOT_FOUND:
      return "NOT_FOUND";
    case UNEXPECTED_CODE::INVALID_INPUT:
      return "INVALID_INPUT";
    case UNEXPECTED_CODE::LIMIT_EXCEEDED:
      return "LIMIT_EXCEEDED";
    case UNEXPECTED_CODE::STORAGE_UNAVAILABLE:
      return "STORAGE_UNAVAILABLE";
  }

  return "UNKNOWN";
}
