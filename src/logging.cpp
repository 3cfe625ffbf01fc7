#include "logging.hpp"

#include <chrono>
#include <format>
#include <iostream>
#include <mutex>

namespace logging {

namespace {
std::mutex logMutex;
}

void log(std::string_view level, std::string_view message) {
  const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
  const auto line = std::format("[{0:%T}] [{1}] {2}", now, level, message);

  std::lock_guard<std::mutex> lock(logMutex);

  if(level.ends_with("ERROR")) {
    std::cerr << line << std::endl;
  } else {
    std::cout << line << std::endl;
  }
}

}
