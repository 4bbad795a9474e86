#pragma once

#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace warden {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_CRITICAL,
    LVL_NONE
};

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();

    // Append every subsequent line to path (in addition to stderr).
    // Returns false and leaves the file sink closed if the file cannot be opened.
    static bool open_file(const std::string& path, std::string& error);
    static void close_file();

    // Silence stderr output (used by tests that only inspect the file sink)
    static void set_console_enabled(bool enabled);

private:
    static Level threshold_;
    static bool console_enabled_;
    static std::ofstream file_;
    static std::mutex mutex_;
};

// Helper to convert Level to string for config parsing
Level string_to_level(const std::string& level_str);

// Label written into each line ("INFO", "WARNING", ...)
const char* level_label(Level level);

} // namespace logging
} // namespace warden

// Macro macros to handle string building
#define LOG_INTERNAL(level, msg) \
    do { \
        std::stringstream ss; \
        ss << msg; \
        warden::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
    } while(0)

#define LOG_DEBUG(msg)    LOG_INTERNAL(warden::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)     LOG_INTERNAL(warden::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)     LOG_INTERNAL(warden::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg)    LOG_INTERNAL(warden::logging::Level::LVL_ERROR, msg)
#define LOG_CRITICAL(msg) LOG_INTERNAL(warden::logging::Level::LVL_CRITICAL, msg)
