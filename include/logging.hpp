#pragma once

#include <string>

namespace mediaframes {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

void set_log_level(LogLevel level);
LogLevel log_level();

// Debug and info lines go to stdout, warnings and errors to stderr.
void log(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log(LogLevel::Debug, message); }
inline void log_info(const std::string& message) { log(LogLevel::Info, message); }
inline void log_warning(const std::string& message) { log(LogLevel::Warning, message); }
inline void log_error(const std::string& message) { log(LogLevel::Error, message); }

} // namespace mediaframes
