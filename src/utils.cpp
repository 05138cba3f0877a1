// src/utils.cpp
// Implementation of utility functions for common operations

#include "termlease/utils.hpp"
#include <algorithm>
#include <sstream>
#include <regex>
#include <iomanip>
#include <ctime>
#include <cerrno>
#include <cctype>

#include <sys/stat.h>
#include <sys/types.h>

namespace termlease {
namespace Utils {

// String utilities
std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.length() >= suffix.length() &&
           str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

// Email utilities
std::string normalize_email(const std::string& email) {
    return to_lower(trim(email));
}

bool is_valid_email(const std::string& email) {
    if (email.empty() || email.length() > 254) {
        return false;
    }

    // local@domain.tld, no whitespace, exactly one '@'
    static const std::regex email_regex(
        R"(^[A-Za-z0-9.!#$%&'*+/=?^_`{|}~-]+@[A-Za-z0-9]([A-Za-z0-9-]*[A-Za-z0-9])?(\.[A-Za-z0-9]([A-Za-z0-9-]*[A-Za-z0-9])?)+$)");
    return std::regex_match(email, email_regex);
}

std::string email_domain(const std::string& email) {
    size_t at = email.rfind('@');
    if (at == std::string::npos) {
        return "";
    }
    return email.substr(at + 1);
}

// Network utilities
bool is_valid_hostname(const std::string& hostname) {
    if (hostname.empty() || hostname.length() > 253) {
        return false;
    }

    // Basic hostname validation regex
    static const std::regex hostname_regex(R"(^[a-zA-Z0-9]([a-zA-Z0-9-]*[a-zA-Z0-9])?(\.[a-zA-Z0-9]([a-zA-Z0-9-]*[a-zA-Z0-9])?)*$)");
    return std::regex_match(hostname, hostname_regex);
}

// Time utilities
std::string timestamp_to_iso8601(Timestamp timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    auto ms = timestamp_ms % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms << "Z";
    return ss.str();
}

// File utilities
bool create_directories(const std::string& path) {
    struct stat st;
    if (path.empty() || (stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode))) {
        return true;
    }

    std::string parent = parent_directory(path);
    if (!parent.empty() && parent != path && !create_directories(parent)) {
        return false;
    }

    return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
}

std::string parent_directory(const std::string& path) {
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return "";
    }
    if (slash == 0) {
        return "/";
    }
    return path.substr(0, slash);
}

} // namespace Utils
} // namespace termlease
