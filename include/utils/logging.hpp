#pragma once
#include <ostream>
#include <string>
#include <string_view>

// Severity threshold for console lines. VRB < DBG < INF < WRN < ERR < CRT < FTL.
enum class LogLevel { Verbose, Debug, Info, Warning, Error, Critical, Fatal };

// Three-letter code, e.g. "INF".
const char* to_string(LogLevel level);

// Accepts the three-letter code or the full name, any case ("wrn", "Warning").
// Throws std::invalid_argument for anything else.
LogLevel parse_log_level(std::string_view text);

void set_log_level(LogLevel level);
LogLevel log_level();

inline bool log_enabled(LogLevel level) { return level >= log_level(); }

// std::cout below WRN, std::cerr from WRN up, a discarding stream when gated.
std::ostream& log_stream(LogLevel level);
