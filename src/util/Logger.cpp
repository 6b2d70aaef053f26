#include "util/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace reprise::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open, the tracker logs from its own thread
static std::string log_path = "/tmp/reprise_debug.log";
static Logger::Level min_level = Logger::Level::Debug;

void Logger::init() {
    init(log_path);
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    log_file.open(log_path, std::ios::trunc);
}

void Logger::set_min_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_level) return;
    if (!log_file.is_open()) {
        // Fallback: open if not initialized
        log_file.open(log_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace reprise::util
