#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace ContrastAudit::Shared {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

class Logger {
  public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        currentLevel_ = level;
    }

    LogLevel getLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return currentLevel_;
    }

    // Redirects output; passing nullptr restores std::clog
    void setOutput(std::ostream* stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = stream ? stream : &std::clog;
    }

    static bool parseLevel(const std::string& name, LogLevel& level) {
        if (name == "debug") {
            level = LogLevel::DEBUG;
        } else if (name == "info") {
            level = LogLevel::INFO;
        } else if (name == "warn" || name == "warning") {
            level = LogLevel::WARN;
        } else if (name == "error") {
            level = LogLevel::ERROR;
        } else {
            return false;
        }
        return true;
    }

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO: return "info";
            case LogLevel::WARN: return "warn";
            case LogLevel::ERROR: return "error";
        }
        return "info";
    }

    template <typename... Args>
    void debug(Args&&... args) {
        log(LogLevel::DEBUG, "DEBUG", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(Args&&... args) {
        log(LogLevel::INFO, "INFO", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(Args&&... args) {
        log(LogLevel::WARN, "WARN", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(Args&&... args) {
        log(LogLevel::ERROR, "ERROR", std::forward<Args>(args)...);
    }

  private:
    LogLevel currentLevel_ = LogLevel::INFO;
    std::ostream* output_ = &std::clog;
    mutable std::mutex mutex_;

    template <typename... Args>
    void log(LogLevel level, const std::string& levelStr, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < currentLevel_) return;

        std::ostringstream oss;
        oss << "[" << levelStr << "] ";
        ((oss << std::forward<Args>(args)), ...);
        (*output_) << oss.str() << std::endl;
    }

    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

#define LOG_DEBUG(...) ContrastAudit::Shared::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) ContrastAudit::Shared::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) ContrastAudit::Shared::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ContrastAudit::Shared::Logger::getInstance().error(__VA_ARGS__)

}  // namespace ContrastAudit::Shared
