#include "sprocket/logging.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sprocket {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO:  return spdlog::level::info;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::OFF:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "off" || lower == "quiet") return LogLevel::OFF;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    std::mutex mutex;

    Impl() {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>("sprocket", console_sink);
        logger->set_level(spdlog::level::trace);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    }

    void add_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->sinks().push_back(file_sink);
    }
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()), level_(LogLevel::INFO) {}

Logger::~Logger() = default;

void Logger::setLevel(LogLevel level) {
    level_ = level;
}

void Logger::setOutputFile(const std::string& path) {
    if (path.empty()) return;
    pImpl->add_file(path);
}

void Logger::write(LogLevel level, const std::string& message) {
    pImpl->logger->log(to_spdlog(level), message);
    if (level >= LogLevel::WARN) {
        pImpl->logger->flush();
    }
}

} // namespace sprocket
