#pragma once

#include <ostream>
#include <string>

namespace pm {

enum class LogLevel { Debug, Info, Warn, Error, Off };

// Process-wide log settings. Defaults: level Warn, stream std::cerr.
void set_log_level(LogLevel level);
LogLevel log_level();

// Passing nullptr restores std::cerr.
void set_log_stream(std::ostream* out);

void log_message(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { log_message(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg) { log_message(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg) { log_message(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { log_message(LogLevel::Error, msg); }

}  // namespace pm
