#include "tftpd/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace tftpd {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_output_mutex;

const char *level_prefix(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "Debug: ";
  case LogLevel::Info:
    return "";
  case LogLevel::Warn:
    return "Warning: ";
  case LogLevel::Error:
    return "Error: ";
  }
  return "";
}

} // namespace

void set_log_level(LogLevel level) { g_level = static_cast<int>(level); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= g_level.load();
}

void log_message(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::ostream &out = level >= LogLevel::Warn ? std::cerr : std::cout;
  out << level_prefix(level) << message << std::endl;
}

} // namespace tftpd
