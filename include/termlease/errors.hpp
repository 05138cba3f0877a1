// include/termlease/errors.hpp
// Purpose: Error handling for the termlease orchestrator
// Provides hierarchical error types for admission, worker and lookup failures

#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <chrono>
#include <system_error>

namespace termlease {

// Base error category for termlease errors
class TermleaseErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "termlease";
    }

    std::string message(int ev) const override;
};

// Global error category instance
const TermleaseErrorCategory& termlease_error_category();

// Error codes enum
enum class ErrorCode {
    // Success
    SUCCESS = 0,

    // Configuration errors (1-99)
    INVALID_CONFIG = 1,
    INVALID_SESSION_DURATION = 2,
    INVALID_CAPACITY = 3,
    INVALID_SWEEP_INTERVAL = 4,
    INVALID_START_TIMEOUT = 5,
    INVALID_PORT_RANGE = 6,

    // Validation errors (100-199)
    INVALID_EMAIL = 100,
    BLOCKED_EMAIL_DOMAIN = 101,
    INVALID_SESSION_ID = 102,
    MALFORMED_REQUEST = 103,
    PAYLOAD_TOO_LARGE = 104,

    // Admission errors (200-299)
    CAPACITY_EXCEEDED = 200,
    PORT_EXHAUSTED = 201,

    // Worker errors (300-399)
    START_FAILURE = 300,
    START_TIMEOUT = 301,
    TEARDOWN_FAILURE = 302,
    HEALTH_CHECK_FAILED = 303,

    // Lookup errors (400-499)
    SESSION_NOT_FOUND = 400,
    SESSION_NOT_RUNNING = 401,

    // Authorization errors (500-599)
    UNAUTHORIZED = 500,

    // Service state errors (600-699)
    ORCHESTRATOR_STOPPED = 600,
    SERVER_ERROR = 601,

    // System errors (700-799)
    SYSTEM_ERROR = 700,
    SPAWN_FAILED = 701,
    IO_ERROR = 702,

    // Unknown/Generic errors (800+)
    UNKNOWN_ERROR = 800
};

// Create error codes
std::error_code make_error_code(ErrorCode ec);

// Base exception class for all termlease errors
class Error : public std::exception {
public:
    explicit Error(const std::string& message)
        : message_(message)
        , error_code_(ErrorCode::UNKNOWN_ERROR)
        , timestamp_(std::chrono::system_clock::now()) {}

    Error(ErrorCode code, const std::string& message)
        : message_(message)
        , error_code_(code)
        , timestamp_(std::chrono::system_clock::now()) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    ErrorCode code() const noexcept {
        return error_code_;
    }

    std::chrono::system_clock::time_point timestamp() const noexcept {
        return timestamp_;
    }

    virtual std::string category() const {
        return "termlease::Error";
    }

protected:
    std::string message_;
    ErrorCode error_code_;
    std::chrono::system_clock::time_point timestamp_;
};

// Configuration-related errors
class ConfigError : public Error {
public:
    ConfigError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, "Configuration error in '" + field + "': " + message)
        , field_(field) {}

    const std::string& field() const noexcept {
        return field_;
    }

    std::string category() const override {
        return "termlease::ConfigError";
    }

private:
    std::string field_;
};

// Validation-related errors (user input)
class ValidationError : public Error {
public:
    ValidationError(ErrorCode code, const std::string& field, const std::string& message)
        : Error(code, message)
        , field_(field) {}

    ValidationError(ErrorCode code, const std::string& field, const std::string& message,
                   const std::string& value)
        : Error(code, message + " (value: '" + value + "')")
        , field_(field)
        , value_(value) {}

    const std::string& field() const noexcept {
        return field_;
    }

    const std::string& value() const noexcept {
        return value_;
    }

    std::string category() const override {
        return "termlease::ValidationError";
    }

private:
    std::string field_;
    std::string value_;
};

// Admission denied: no free slot or no free port
class CapacityError : public Error {
public:
    CapacityError(ErrorCode code, const std::string& message, size_t limit)
        : Error(code, message)
        , limit_(limit) {}

    size_t limit() const noexcept {
        return limit_;
    }

    std::string category() const override {
        return "termlease::CapacityError";
    }

private:
    size_t limit_;
};

// Container runtime failures
class WorkerError : public Error {
public:
    WorkerError(ErrorCode code, const std::string& operation, const std::string& message)
        : Error(code, "Worker error during '" + operation + "': " + message)
        , operation_(operation) {}

    const std::string& operation() const noexcept {
        return operation_;
    }

    std::string category() const override {
        return "termlease::WorkerError";
    }

private:
    std::string operation_;
};

// Unknown or purged session id
class NotFoundError : public Error {
public:
    NotFoundError(ErrorCode code, const SessionId& session_id, const std::string& message)
        : Error(code, message)
        , session_id_(session_id) {}

    const SessionId& session_id() const noexcept {
        return session_id_;
    }

    std::string category() const override {
        return "termlease::NotFoundError";
    }

private:
    SessionId session_id_;
};

// Privileged operation rejected
class AuthError : public Error {
public:
    AuthError(ErrorCode code, const std::string& message)
        : Error(code, "Authorization error: " + message) {}

    std::string category() const override {
        return "termlease::AuthError";
    }
};

// System-related errors
class SystemError : public Error {
public:
    SystemError(ErrorCode code, const std::string& message)
        : Error(code, "System error: " + message) {}

    SystemError(ErrorCode code, const std::string& message, const std::error_code& system_error)
        : Error(code, "System error: " + message + " (" + system_error.message() + ")")
        , system_error_(system_error) {}

    const std::error_code& system_error() const noexcept {
        return system_error_;
    }

    std::string category() const override {
        return "termlease::SystemError";
    }

private:
    std::error_code system_error_;
};

// Error factory functions for common error scenarios
namespace Errors {

// Configuration errors
ConfigError invalid_session_duration(std::chrono::seconds duration);
ConfigError invalid_capacity(size_t max_sessions);
ConfigError invalid_sweep_interval(std::chrono::milliseconds interval);
ConfigError invalid_start_timeout(std::chrono::milliseconds timeout);
ConfigError invalid_port_range(Port base_port, size_t count);

// Validation errors
ValidationError empty_email();
ValidationError invalid_email(const std::string& email);
ValidationError blocked_email_domain(const std::string& domain);
ValidationError malformed_request(const std::string& details);

// Admission errors
CapacityError capacity_exceeded(size_t max_sessions);
CapacityError port_exhausted(size_t pool_size);

// Worker errors
WorkerError start_failure(const SessionId& session_id, const std::string& reason);
WorkerError start_timeout(const SessionId& session_id, std::chrono::milliseconds timeout);
WorkerError teardown_failure(const WorkerRef& worker_ref, const std::string& reason);
WorkerError health_check_failed(const WorkerRef& worker_ref, const std::string& reason);

// Lookup errors
NotFoundError session_not_found(const SessionId& session_id);
NotFoundError session_not_running(const SessionId& session_id);

// Authorization errors
AuthError unauthorized();

// System errors
SystemError spawn_failed(const std::string& program, int error_number);
SystemError io_error(const std::string& resource, int error_number);

} // namespace Errors

} // namespace termlease

// Enable std::error_code support
namespace std {
template <>
struct is_error_code_enum<termlease::ErrorCode> : true_type {};
}
