#pragma once

#include <string>

namespace pdf_mt {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// Writes one "[tag] message" line to stderr. Lines from different threads never interleave.
void log_message(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) {
    if (log_enabled(LogLevel::Debug)) {
        log_message(LogLevel::Debug, message);
    }
}

inline void log_info(const std::string& message) {
    log_message(LogLevel::Info, message);
}

inline void log_warn(const std::string& message) {
    log_message(LogLevel::Warn, message);
}

inline void log_error(const std::string& message) {
    log_message(LogLevel::Error, message);
}

}  // namespace pdf_mt
