#pragma once
#include <string>

enum class LogLevel { error = 0, warn = 1, info = 2, debug = 3 };

void set_log_level(LogLevel lvl);
LogLevel log_level();

// "error" | "warn" | "info" | "debug"; unknown names throw std::invalid_argument
LogLevel parse_log_level(const std::string& name);

// Writes "[level] component: message" to stderr when lvl is enabled.
void log_msg(LogLevel lvl, const std::string& component, const std::string& message);

inline void log_error(const std::string& c, const std::string& m) { log_msg(LogLevel::error, c, m); }
inline void log_warn(const std::string& c, const std::string& m)  { log_msg(LogLevel::warn, c, m); }
inline void log_info(const std::string& c, const std::string& m)  { log_msg(LogLevel::info, c, m); }
inline void log_debug(const std::string& c, const std::string& m) { log_msg(LogLevel::debug, c, m); }
