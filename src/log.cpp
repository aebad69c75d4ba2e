// -----------------------------------------------------------------------------
// log.cpp: leveled stderr logger
//
// POLICY:
//   - Threshold is process-wide (atomic); the sink is std::cerr.
//   - Formatting happens outside the lock; only the write is serialized.
// -----------------------------------------------------------------------------
#include "meshrelay/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace meshrelay {
namespace log {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::Info)};
std::mutex g_write_mutex;

const char* tag(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "[DEBUG]";
    case LogLevel::Info:  return "[INFO] ";
    case LogLevel::Warn:  return "[WARN] ";
    case LogLevel::Error: return "[ERROR]";
    case LogLevel::Off:   break;
  }
  return "[?]    ";
}

std::string timestamp() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);
  const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
     << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

} // namespace

void set_level(LogLevel min_level) {
  g_level.store(static_cast<uint8_t>(min_level));
}

LogLevel level() {
  return static_cast<LogLevel>(g_level.load());
}

LogLevel parse_level(std::string_view text, LogLevel fallback) {
  if (text == "debug") return LogLevel::Debug;
  if (text == "info")  return LogLevel::Info;
  if (text == "warn")  return LogLevel::Warn;
  if (text == "error") return LogLevel::Error;
  if (text == "off")   return LogLevel::Off;
  return fallback;
}

void write(LogLevel lvl, std::string_view component, std::string_view message) {
  if (lvl == LogLevel::Off) return;
  if (static_cast<uint8_t>(lvl) < g_level.load()) return;   // below threshold

  std::ostringstream line;
  line << timestamp() << ' ' << tag(lvl) << ' ' << component << ": " << message << '\n';

  std::lock_guard<std::mutex> lock(g_write_mutex);
  std::cerr << line.str();
}

} // namespace log
} // namespace meshrelay
