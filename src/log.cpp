#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace pdf_mt {

namespace {

std::atomic<LogLevel> g_min_level{LogLevel::Info};
std::mutex g_log_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "[debug] ";
        case LogLevel::Info:
            return "[info] ";
        case LogLevel::Warn:
            return "[warn] ";
        case LogLevel::Error:
            return "[error] ";
    }
    return "[info] ";
}

}  // namespace

void set_log_level(LogLevel level) {
    g_min_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() {
    return g_min_level.load(std::memory_order_relaxed);
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(log_level());
}

void log_message(LogLevel level, const std::string& message) {
    if (!log_enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << level_tag(level) << message << "\n";
    std::cerr.flush();
}

}  // namespace pdf_mt
