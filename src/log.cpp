#include "log.hpp"
#include <iostream>
#include <stdexcept>

static LogLevel g_level = LogLevel::info;

static const char* level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::error: return "error";
    case LogLevel::warn:  return "warn";
    case LogLevel::info:  return "info";
    case LogLevel::debug: return "debug";
  }
  return "?";
}

void set_log_level(LogLevel lvl) { g_level = lvl; }
LogLevel log_level() { return g_level; }

LogLevel parse_log_level(const std::string& name) {
  if (name == "error") return LogLevel::error;
  if (name == "warn")  return LogLevel::warn;
  if (name == "info")  return LogLevel::info;
  if (name == "debug") return LogLevel::debug;
  throw std::invalid_argument("unknown log level: " + name);
}

void log_msg(LogLevel lvl, const std::string& component, const std::string& message) {
  if ((int)lvl > (int)g_level) return;
  std::cerr << "[" << level_name(lvl) << "] " << component << ": " << message << "\n";
}
