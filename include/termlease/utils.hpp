// include/termlease/utils.hpp
// Purpose: Utility functions and helpers for the termlease orchestrator
// String, email, time and file helpers shared across modules

#pragma once

#include "types.hpp"
#include <string>

namespace termlease {
namespace Utils {

// String utilities
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

// Email utilities
std::string normalize_email(const std::string& email);     // trimmed, lower-cased
bool is_valid_email(const std::string& email);
std::string email_domain(const std::string& email);        // empty if no '@'

// Network utilities
bool is_valid_hostname(const std::string& hostname);

// Time utilities
std::string timestamp_to_iso8601(Timestamp timestamp_ms);

// File utilities
bool create_directories(const std::string& path);
std::string parent_directory(const std::string& path);

} // namespace Utils
} // namespace termlease
