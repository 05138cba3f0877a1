// src/logger.cpp
// Implementation of the internal logger

#include "termlease/logger.hpp"
#include "termlease/utils.hpp"
#include <iostream>

namespace termlease {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::configure(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (file_.is_open()) {
        file_.close();
    }

    if (config_.log_to_file && !config_.log_file_path.empty()) {
        Utils::create_directories(Utils::parent_directory(config_.log_file_path));
        file_.open(config_.log_file_path, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "Failed to open log file '" << config_.log_file_path
                      << "', logging to console only" << std::endl;
            config_.log_to_file = false;
            config_.log_to_console = true;
        }
    }
}

SystemLogLevel Logger::level() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.level;
}

void Logger::set_level(SystemLogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.level = level;
}

bool Logger::should_log(SystemLogLevel level) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return level != SystemLogLevel::NONE &&
           static_cast<uint8_t>(level) <= static_cast<uint8_t>(config_.level);
}

void Logger::log(SystemLogLevel level, const std::string& component, const std::string& message) {
    std::string line = Utils::timestamp_to_iso8601(Utils::now_milliseconds()) + " [" +
                       log_level_to_string(level) + "] " + component + ": " + message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.log_to_console) {
        std::cerr << line << std::endl;
    }
    if (config_.log_to_file && file_.is_open()) {
        file_ << line << std::endl;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

std::string log_level_to_string(SystemLogLevel level) {
    switch (level) {
        case SystemLogLevel::NONE: return "NONE";
        case SystemLogLevel::ERROR: return "ERROR";
        case SystemLogLevel::WARN: return "WARN";
        case SystemLogLevel::INFO: return "INFO";
        case SystemLogLevel::DEBUG: return "DEBUG";
        case SystemLogLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

} // namespace termlease
