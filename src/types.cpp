// src/types.cpp
// Implementation of utility functions for types and constants

#include "termlease/types.hpp"
#include <random>
#include <array>

namespace termlease {
namespace Utils {

std::string session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::PROVISIONING: return "provisioning";
        case SessionState::RUNNING: return "running";
        case SessionState::EXPIRING: return "expiring";
        case SessionState::TERMINATED: return "terminated";
        default: return "unknown";
    }
}

std::string termination_cause_to_string(TerminationCause cause) {
    switch (cause) {
        case TerminationCause::NONE: return "none";
        case TerminationCause::EXPIRED: return "expired";
        case TerminationCause::DELETED: return "deleted";
        case TerminationCause::CRASHED: return "crashed";
        case TerminationCause::START_FAILED: return "start_failed";
        case TerminationCause::SHUTDOWN: return "shutdown";
        default: return "unknown";
    }
}

SessionId generate_session_id() {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 8) {
        uint64_t word = dis(gen);
        for (size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
        }
    }

    // URL-safe base64 of 16 bytes, padding stripped
    SessionId id;
    id.reserve(22);
    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : bytes) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            id.push_back(alphabet[(buffer >> bits) & 0x3F]);
        }
    }
    if (bits > 0) {
        id.push_back(alphabet[(buffer << (6 - bits)) & 0x3F]);
    }

    return id;
}

} // namespace Utils
} // namespace termlease
