#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace warden {
namespace logging {

Level Logger::threshold_ = Level::LVL_INFO;
bool Logger::console_enabled_ = true;
std::ofstream Logger::file_;
std::mutex Logger::mutex_;

void Logger::init(Level threshold) {
    threshold_ = threshold;
}

void Logger::set_level(Level level) {
    threshold_ = level;
}

Level Logger::level() {
    return threshold_;
}

bool Logger::open_file(const std::string& path, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        error = "Cannot open log file: " + path;
        return false;
    }
    return true;
}

void Logger::close_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::set_console_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

void Logger::log(Level level, const char* file, int line, const std::string& message) {
    (void)file;
    (void)line;
    if (level < threshold_ || level == Level::LVL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream out;

    // Timestamp
    out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    // Level
    out << " [" << level_label(level) << "] ";

    // Message
    out << message << "\n";

    const std::string text = out.str();

    std::lock_guard<std::mutex> lock(mutex_);
    if (console_enabled_) {
        std::cerr << text;
    }
    if (file_.is_open()) {
        file_ << text;
    }

    // Alerts must reach disk before the process can die
    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
        if (file_.is_open()) {
            file_.flush();
        }
    }
}

const char* level_label(Level level) {
    switch (level) {
        case Level::LVL_DEBUG: return "DEBUG";
        case Level::LVL_INFO: return "INFO";
        case Level::LVL_WARN: return "WARNING";
        case Level::LVL_ERROR: return "ERROR";
        case Level::LVL_CRITICAL: return "CRITICAL";
        default: return "NONE";
    }
}

Level string_to_level(const std::string& level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN" || s == "WARNING") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "CRITICAL") return Level::LVL_CRITICAL;

    return Level::LVL_INFO; // Default
}

} // namespace logging
} // namespace warden
