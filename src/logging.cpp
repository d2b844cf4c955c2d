#include "logging.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace logging {

namespace {

// Serialize writes from concurrent sessions
std::mutex g_log_mutex;
std::atomic<Level> g_level{Level::INFO};

const char* level_name(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
    }
    return "?";
}

} // namespace

void set_level(Level level) {
    g_level = level;
}

void write(Level level, const std::string& tag, const std::string& text) {
    if (level < g_level.load()) return;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& out = (level >= Level::WARN) ? std::cerr : std::cout;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << " [" << level_name(level) << "] [" << tag << "] " << text << std::endl;
}

} // namespace logging
