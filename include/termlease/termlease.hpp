// include/termlease/termlease.hpp
// Purpose: Main header file for the termlease orchestrator library
// This is the primary include for embedders and the termleased daemon

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "orchestrator.hpp"
#include "http.hpp"
#include "lifecycle.hpp"

namespace termlease {

// Version information
constexpr const char* VERSION = "1.0.0";
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

// Get library version
inline std::string version() {
    return VERSION;
}

} // namespace termlease
