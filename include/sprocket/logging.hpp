#pragma once

#include <memory>
#include <sstream>
#include <string>

namespace sprocket {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

// Parses "debug", "info", "warn"/"warning", "error", "off" (case-insensitive).
// Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& getInstance();

    void setLevel(LogLevel level);

    // Adds a file sink next to the console sink. Empty path is a no-op.
    void setOutputFile(const std::string& path);

    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (level < level_) return;
        std::ostringstream ss;
        (ss << ... << std::forward<Args>(args));
        write(level, ss.str());
    }

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::string& message);

    class Impl;
    std::unique_ptr<Impl> pImpl;
    LogLevel level_;
};

// Convenience macros
#define LOG_DEBUG(...) sprocket::Logger::getInstance().log(sprocket::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  sprocket::Logger::getInstance().log(sprocket::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WARN(...)  sprocket::Logger::getInstance().log(sprocket::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERROR(...) sprocket::Logger::getInstance().log(sprocket::LogLevel::ERROR, __VA_ARGS__)

} // namespace sprocket
