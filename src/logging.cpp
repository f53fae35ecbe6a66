#include "logging.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace mediaframes {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_output_mutex;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

void log(LogLevel level, const std::string& message) {
    if (level < g_level.load()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local_time{};
    localtime_r(&time, &local_time);

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::ostream& out = level >= LogLevel::Warning ? std::cerr : std::cout;
    out << "[" << std::put_time(&local_time, "%H:%M:%S") << "] ["
        << level_name(level) << "] " << message << std::endl;
}

} // namespace mediaframes
