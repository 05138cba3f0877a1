// include/termlease/types.hpp
// Purpose: Core types, constants, and enums for the termlease session orchestrator
// Shared by the registry, supervisor, driver and HTTP layers

#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <chrono>
#include <cstdint>
#include <functional>

namespace termlease {

// Type aliases for clarity
using SessionId = std::string;
using WorkerRef = std::string;   // container id returned by the runtime
using Email = std::string;
using Port = uint16_t;
using Timestamp = uint64_t;      // milliseconds since the Unix epoch
using Environment = std::unordered_map<std::string, std::string>;

// Source of "now" for everything that compares against deadlines
using Clock = std::function<Timestamp()>;

// Session lifecycle; transitions only ever move forward
enum class SessionState : uint8_t {
    PROVISIONING = 0,
    RUNNING = 1,
    EXPIRING = 2,
    TERMINATED = 3
};

// Why a session left the Running state
enum class TerminationCause : uint8_t {
    NONE = 0,
    EXPIRED = 1,       // wall clock reached expires_at
    DELETED = 2,       // explicit delete request
    CRASHED = 3,       // health sweep found the worker dead
    START_FAILED = 4,  // worker never came up
    SHUTDOWN = 5       // orchestrator shutting down
};

// Canonical session record. The registry owns the original; everyone else
// receives copies.
struct Session {
    SessionId id;
    Email email;
    SessionState state = SessionState::PROVISIONING;
    Port port = 0;
    WorkerRef worker_ref;
    Timestamp created_at = 0;
    Timestamp expires_at = 0;
    Timestamp terminated_at = 0;
    TerminationCause cause = TerminationCause::NONE;
    uint32_t teardown_attempts = 0;

    bool is_active() const {
        return state != SessionState::TERMINATED;
    }

    // Remaining lifetime in whole seconds, clamped at zero
    int64_t remaining_seconds(Timestamp now) const {
        if (state == SessionState::TERMINATED || now >= expires_at) {
            return 0;
        }
        return static_cast<int64_t>((expires_at - now) / 1000);
    }
};

// Captured contact, independent of the session lifecycle
struct Lead {
    Email email;
    SessionId session_id;
    Timestamp captured_at = 0;
    std::string client_address;  // empty when unknown
};

// Returned to callers of create_session
struct SessionGrant {
    SessionId session_id;
    SessionState state = SessionState::RUNNING;
    std::string host;
    Port port = 0;
    std::string terminal_path;   // e.g. /terminal/<id>
    Timestamp expires_at = 0;
    std::chrono::seconds duration{0};
};

// Read-only projection returned by get_session
struct SessionStatus {
    SessionId session_id;
    SessionState state = SessionState::TERMINATED;
    bool active = false;
    int64_t remaining_seconds = 0;
    Port port = 0;
    Timestamp expires_at = 0;
    TerminationCause cause = TerminationCause::NONE;
};

// Default values, taken from the original demo deployment
namespace Defaults {
    constexpr int64_t SESSION_DURATION_SECONDS = 15 * 60;
    constexpr size_t MAX_CONCURRENT_SESSIONS = 10;
    constexpr Port BASE_PORT = 7700;
    constexpr int64_t SWEEP_INTERVAL_MS = 60 * 1000;
    constexpr int64_t START_TIMEOUT_MS = 30 * 1000;
    constexpr int64_t START_TIMEOUT_CEILING_MS = 120 * 1000;
    constexpr int64_t STOP_TIMEOUT_MS = 15 * 1000;
    constexpr int64_t HEALTH_CHECK_TIMEOUT_MS = 5 * 1000;
    constexpr int64_t TOMBSTONE_RETENTION_SECONDS = 60 * 60;
    constexpr Port CONTAINER_PORT = 7681;
    constexpr Port LISTEN_PORT = 8000;
    constexpr const char* WORKER_IMAGE = "autonops/infraiq-demo:latest";
    constexpr const char* CONTAINER_PREFIX = "demo-";
    constexpr const char* MEMORY_LIMIT = "512m";
    constexpr const char* CPU_LIMIT = "0.5";
}

namespace Utils {

// Get current timestamp in milliseconds
inline Timestamp now_milliseconds() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string session_state_to_string(SessionState state);
std::string termination_cause_to_string(TerminationCause cause);

// 128 random bits, URL-safe base64 without padding (22 characters)
SessionId generate_session_id();

} // namespace Utils

} // namespace termlease
