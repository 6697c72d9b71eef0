#include "utils/logging.hpp"
#include "utils/strings.hpp"

#include <atomic>
#include <iostream>
#include <stdexcept>

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

struct LevelName {
  LogLevel    level;
  const char* code;
  const char* name;
};

constexpr LevelName kLevels[] = {
  {LogLevel::Verbose,  "VRB", "VERBOSE"},
  {LogLevel::Debug,    "DBG", "DEBUG"},
  {LogLevel::Info,     "INF", "INFO"},
  {LogLevel::Warning,  "WRN", "WARNING"},
  {LogLevel::Error,    "ERR", "ERROR"},
  {LogLevel::Critical, "CRT", "CRITICAL"},
  {LogLevel::Fatal,    "FTL", "FATAL"},
};

}  // namespace

const char* to_string(LogLevel level) {
  for (const auto& l : kLevels) {
    if (l.level == level) return l.code;
  }
  return "???";
}

LogLevel parse_log_level(std::string_view text) {
  const std::string upper = to_upper_ascii(std::string(trim_ascii(text)));
  for (const auto& l : kLevels) {
    if (upper == l.code || upper == l.name) return l.level;
  }
  throw std::invalid_argument("unknown log level '" + std::string(text) + "'");
}

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level), std::memory_order_relaxed); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed)); }

std::ostream& log_stream(LogLevel level) {
  // no streambuf: every insert fails silently; one per thread so state never races
  thread_local std::ostream discard(nullptr);
  if (!log_enabled(level)) return discard;
  return level >= LogLevel::Warning ? std::cerr : std::cout;
}
