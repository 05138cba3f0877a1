// include/termlease/logger.hpp
// Purpose: Internal logging for the termlease orchestrator
// Console (stderr) and file sinks filtered by SystemLogLevel

#pragma once

#include "config.hpp"
#include <string>
#include <sstream>
#include <fstream>
#include <mutex>

namespace termlease {

class Logger {
public:
    // Process-wide logger used by the TL_LOG_* macros
    static Logger& instance();

    // Apply level and sinks; opens the log file if requested
    void configure(const LoggingConfig& config);

    SystemLogLevel level() const noexcept;
    void set_level(SystemLogLevel level);
    bool should_log(SystemLogLevel level) const noexcept;

    void log(SystemLogLevel level, const std::string& component, const std::string& message);

    // Close the file sink
    void shutdown();

private:
    Logger() = default;

    mutable std::mutex mutex_;
    LoggingConfig config_;
    std::ofstream file_;
};

std::string log_level_to_string(SystemLogLevel level);

} // namespace termlease

// Convenience macros; the stream expression is only evaluated when the level is enabled
#define TL_LOG_AT(lvl, component, expr)                                              \
    do {                                                                             \
        auto& tl_logger_ = ::termlease::Logger::instance();                          \
        if (tl_logger_.should_log(lvl)) {                                            \
            std::ostringstream tl_oss_;                                              \
            tl_oss_ << expr;                                                         \
            tl_logger_.log(lvl, component, tl_oss_.str());                           \
        }                                                                            \
    } while (0)

#define TL_LOG_ERROR(component, expr) TL_LOG_AT(::termlease::SystemLogLevel::ERROR, component, expr)
#define TL_LOG_WARN(component, expr)  TL_LOG_AT(::termlease::SystemLogLevel::WARN, component, expr)
#define TL_LOG_INFO(component, expr)  TL_LOG_AT(::termlease::SystemLogLevel::INFO, component, expr)
#define TL_LOG_DEBUG(component, expr) TL_LOG_AT(::termlease::SystemLogLevel::DEBUG, component, expr)
#define TL_LOG_TRACE(component, expr) TL_LOG_AT(::termlease::SystemLogLevel::TRACE, component, expr)
