// src/errors.cpp
// Implementation of error handling system with messages and factory functions

#include "termlease/errors.hpp"
#include <sstream>

namespace termlease {

// Error category implementation
std::string TermleaseErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::SUCCESS:
            return "Success";

        // Configuration errors (1-99)
        case ErrorCode::INVALID_CONFIG:
            return "Invalid configuration";
        case ErrorCode::INVALID_SESSION_DURATION:
            return "Invalid session duration";
        case ErrorCode::INVALID_CAPACITY:
            return "Invalid maximum concurrent sessions";
        case ErrorCode::INVALID_SWEEP_INTERVAL:
            return "Invalid sweep interval";
        case ErrorCode::INVALID_START_TIMEOUT:
            return "Invalid worker start timeout";
        case ErrorCode::INVALID_PORT_RANGE:
            return "Invalid port range";

        // Validation errors (100-199)
        case ErrorCode::INVALID_EMAIL:
            return "Invalid email address";
        case ErrorCode::BLOCKED_EMAIL_DOMAIN:
            return "Email domain not accepted";
        case ErrorCode::INVALID_SESSION_ID:
            return "Invalid session ID";
        case ErrorCode::MALFORMED_REQUEST:
            return "Malformed request";
        case ErrorCode::PAYLOAD_TOO_LARGE:
            return "Payload too large";

        // Admission errors (200-299)
        case ErrorCode::CAPACITY_EXCEEDED:
            return "Capacity exceeded";
        case ErrorCode::PORT_EXHAUSTED:
            return "Port pool exhausted";

        // Worker errors (300-399)
        case ErrorCode::START_FAILURE:
            return "Worker failed to start";
        case ErrorCode::START_TIMEOUT:
            return "Worker start timed out";
        case ErrorCode::TEARDOWN_FAILURE:
            return "Worker failed to stop";
        case ErrorCode::HEALTH_CHECK_FAILED:
            return "Worker health check failed";

        // Lookup errors (400-499)
        case ErrorCode::SESSION_NOT_FOUND:
            return "Session not found";
        case ErrorCode::SESSION_NOT_RUNNING:
            return "Session not running";

        // Authorization errors (500-599)
        case ErrorCode::UNAUTHORIZED:
            return "Unauthorized";

        // Service state errors (600-699)
        case ErrorCode::ORCHESTRATOR_STOPPED:
            return "Orchestrator stopped";
        case ErrorCode::SERVER_ERROR:
            return "Server error";

        // System errors (700-799)
        case ErrorCode::SYSTEM_ERROR:
            return "System error";
        case ErrorCode::SPAWN_FAILED:
            return "Failed to spawn process";
        case ErrorCode::IO_ERROR:
            return "I/O error";

        // Unknown/Generic errors (800+)
        case ErrorCode::UNKNOWN_ERROR:
            return "Unknown error";

        default:
            return "Unknown error code";
    }
}

const TermleaseErrorCategory& termlease_error_category() {
    static const TermleaseErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode ec) {
    return std::error_code{static_cast<int>(ec), termlease_error_category()};
}

// Error factory functions implementation
namespace Errors {

// Configuration errors
ConfigError invalid_session_duration(std::chrono::seconds duration) {
    return ConfigError(ErrorCode::INVALID_SESSION_DURATION, "session_duration",
        "Session duration must be between 10s and 24h, got: " + std::to_string(duration.count()) + "s");
}

ConfigError invalid_capacity(size_t max_sessions) {
    return ConfigError(ErrorCode::INVALID_CAPACITY, "max_concurrent_sessions",
        "Max concurrent sessions must be between 1 and 1024, got: " + std::to_string(max_sessions));
}

ConfigError invalid_sweep_interval(std::chrono::milliseconds interval) {
    return ConfigError(ErrorCode::INVALID_SWEEP_INTERVAL, "sweep_interval",
        "Sweep interval must be between 100ms and 1h, got: " + std::to_string(interval.count()) + "ms");
}

ConfigError invalid_start_timeout(std::chrono::milliseconds timeout) {
    return ConfigError(ErrorCode::INVALID_START_TIMEOUT, "start_timeout",
        "Worker start timeout must be between 1s and " +
        std::to_string(Defaults::START_TIMEOUT_CEILING_MS / 1000) + "s, got: " +
        std::to_string(timeout.count()) + "ms");
}

ConfigError invalid_port_range(Port base_port, size_t count) {
    std::ostringstream oss;
    oss << "Port range [" << base_port << ", " << (static_cast<size_t>(base_port) + count)
        << ") must lie within 1-65535";
    return ConfigError(ErrorCode::INVALID_PORT_RANGE, "base_port", oss.str());
}

// Validation errors
ValidationError empty_email() {
    return ValidationError(ErrorCode::INVALID_EMAIL, "email", "Email address is required");
}

ValidationError invalid_email(const std::string& email) {
    if (email.length() > 254) {
        return ValidationError(ErrorCode::INVALID_EMAIL, "email",
            "Email address too long (max 254 chars)", email.substr(0, 50) + "...");
    }
    return ValidationError(ErrorCode::INVALID_EMAIL, "email",
        "Email address is not valid", email);
}

ValidationError blocked_email_domain(const std::string& domain) {
    (void)domain;
    return ValidationError(ErrorCode::BLOCKED_EMAIL_DOMAIN, "email",
        "Please use your company email address");
}

ValidationError malformed_request(const std::string& details) {
    return ValidationError(ErrorCode::MALFORMED_REQUEST, "request",
        "Malformed request: " + details);
}

// Admission errors
CapacityError capacity_exceeded(size_t max_sessions) {
    return CapacityError(ErrorCode::CAPACITY_EXCEEDED,
        "All demo slots are currently in use. Please try again in a few minutes.",
        max_sessions);
}

CapacityError port_exhausted(size_t pool_size) {
    std::ostringstream oss;
    oss << "No free port in pool of " << pool_size;
    return CapacityError(ErrorCode::PORT_EXHAUSTED, oss.str(), pool_size);
}

// Worker errors
WorkerError start_failure(const SessionId& session_id, const std::string& reason) {
    return WorkerError(ErrorCode::START_FAILURE, "start",
        "Session " + session_id.substr(0, 8) + ": " + reason);
}

WorkerError start_timeout(const SessionId& session_id, std::chrono::milliseconds timeout) {
    std::ostringstream oss;
    oss << "Session " << session_id.substr(0, 8) << ": runtime did not confirm startup within "
        << timeout.count() << "ms";
    return WorkerError(ErrorCode::START_TIMEOUT, "start", oss.str());
}

WorkerError teardown_failure(const WorkerRef& worker_ref, const std::string& reason) {
    return WorkerError(ErrorCode::TEARDOWN_FAILURE, "stop",
        "Worker " + worker_ref.substr(0, 12) + ": " + reason);
}

WorkerError health_check_failed(const WorkerRef& worker_ref, const std::string& reason) {
    return WorkerError(ErrorCode::HEALTH_CHECK_FAILED, "is_alive",
        "Worker " + worker_ref.substr(0, 12) + ": " + reason);
}

// Lookup errors
NotFoundError session_not_found(const SessionId& session_id) {
    return NotFoundError(ErrorCode::SESSION_NOT_FOUND, session_id, "Session not found");
}

NotFoundError session_not_running(const SessionId& session_id) {
    return NotFoundError(ErrorCode::SESSION_NOT_RUNNING, session_id, "Session has expired");
}

// Authorization errors
AuthError unauthorized() {
    return AuthError(ErrorCode::UNAUTHORIZED, "Unauthorized");
}

// System errors
SystemError spawn_failed(const std::string& program, int error_number) {
    return SystemError(ErrorCode::SPAWN_FAILED, "Failed to spawn '" + program + "'",
        std::error_code(error_number, std::generic_category()));
}

SystemError io_error(const std::string& resource, int error_number) {
    return SystemError(ErrorCode::IO_ERROR, "I/O failure on " + resource,
        std::error_code(error_number, std::generic_category()));
}

} // namespace Errors
} // namespace termlease
