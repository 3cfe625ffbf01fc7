#pragma once

#include <string_view>

namespace logging {

// Writes "[HH:MM:SS] [LEVEL] message" to stdout, or to stderr for levels
// ending in ERROR. Safe to call from any request thread.
void log(std::string_view level, std::string_view message);

inline void info(std::string_view message) { log("INFO", message); }
inline void warn(std::string_view message) { log("WARN", message); }
inline void error(std::string_view message) { log("ERROR", message); }

}
