/**
 * @file log.hpp
 * @brief Leveled diagnostics for the relay core and its tools.
 *
 * @details
 * Lines go to `std::cerr` as `<time> [LEVEL] component: message`. One mutex
 * keeps lines whole when the heartbeat and foreground sends log at once.
 * Tests set the threshold to `Off` to keep output clean.
 */
#ifndef MESHRELAY_LOG_HPP
#define MESHRELAY_LOG_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace meshrelay {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

namespace log {

void set_level(LogLevel min_level);
LogLevel level();

/// Parse "debug" / "info" / "warn" / "error" / "off"; unknown text keeps `fallback`.
LogLevel parse_level(std::string_view text, LogLevel fallback);

void write(LogLevel lvl, std::string_view component, std::string_view message);

inline void debug(std::string_view c, std::string_view m) { write(LogLevel::Debug, c, m); }
inline void info (std::string_view c, std::string_view m) { write(LogLevel::Info,  c, m); }
inline void warn (std::string_view c, std::string_view m) { write(LogLevel::Warn,  c, m); }
inline void error(std::string_view c, std::string_view m) { write(LogLevel::Error, c, m); }

} // namespace log
} // namespace meshrelay

#endif // MESHRELAY_LOG_HPP
