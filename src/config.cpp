// src/config.cpp
// Implementation of configuration system with validation and presets

#include "termlease/config.hpp"
#include "termlease/utils.hpp"
#include <sstream>
#include <cstdlib>
#include <cstring>
#include <algorithm>

namespace termlease {

Config& Config::set_session_duration(std::chrono::seconds duration) {
    session_.duration = duration;
    return *this;
}

Config& Config::set_max_concurrent_sessions(size_t max_sessions) {
    session_.max_concurrent_sessions = max_sessions;
    return *this;
}

Config& Config::set_sweep_interval(std::chrono::milliseconds interval) {
    session_.sweep_interval = interval;
    return *this;
}

Config& Config::set_tombstone_retention(std::chrono::seconds retention) {
    session_.tombstone_retention = retention;
    return *this;
}

Config& Config::set_start_timeout(std::chrono::milliseconds timeout) {
    worker_.start_timeout = timeout;
    return *this;
}

Config& Config::set_stop_timeout(std::chrono::milliseconds timeout) {
    worker_.stop_timeout = timeout;
    return *this;
}

Config& Config::set_worker_image(const std::string& image) {
    worker_.image = image;
    return *this;
}

Config& Config::set_runtime_binary(const std::string& binary) {
    worker_.runtime_binary = binary;
    return *this;
}

Config& Config::set_worker_env(const std::string& key, const std::string& value) {
    worker_.environment[key] = value;
    return *this;
}

Config& Config::set_base_port(Port port) {
    ports_.base_port = port;
    return *this;
}

Config& Config::set_public_host(const std::string& host) {
    ports_.public_host = host;
    return *this;
}

Config& Config::set_listen(const std::string& bind_address, Port port) {
    server_.bind_address = bind_address;
    server_.listen_port = port;
    return *this;
}

Config& Config::set_admin_secret(const std::string& secret) {
    server_.admin_secret = secret;
    return *this;
}

Config& Config::set_lead_file(const std::string& path) {
    leads_.persistence_file = path;
    return *this;
}

Config& Config::require_company_email(bool require) {
    leads_.require_company_email = require;
    return *this;
}

Config& Config::set_system_log_level(SystemLogLevel level) {
    logging_.level = level;
    return *this;
}

Config& Config::set_log_to_file(const std::string& path) {
    logging_.log_to_file = true;
    logging_.log_file_path = path;
    return *this;
}

void Config::validate() const {
    std::vector<std::string> errors = validation_errors();
    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Configuration validation failed:\n";
        for (const auto& error : errors) {
            oss << "  - " << error << "\n";
        }
        throw ConfigError(ErrorCode::INVALID_CONFIG, "config", oss.str());
    }
}

bool Config::is_valid() const noexcept {
    try {
        return validation_errors().empty();
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> Config::validation_errors() const {
    std::vector<std::string> errors;

    try {
        validate_session_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_worker_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_port_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    try {
        validate_server_config();
    } catch (const ConfigError& e) {
        errors.push_back(e.what());
    }

    return errors;
}

void Config::validate_session_config() const {
    if (session_.duration.count() < 10 || session_.duration.count() > 24 * 60 * 60) {
        throw Errors::invalid_session_duration(session_.duration);
    }

    if (session_.max_concurrent_sessions == 0 || session_.max_concurrent_sessions > 1024) {
        throw Errors::invalid_capacity(session_.max_concurrent_sessions);
    }

    if (session_.sweep_interval.count() < 100 || session_.sweep_interval.count() > 60 * 60 * 1000) {
        throw Errors::invalid_sweep_interval(session_.sweep_interval);
    }

    if (session_.tombstone_retention.count() < 0) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "tombstone_retention",
            "Tombstone retention cannot be negative");
    }
}

void Config::validate_worker_config() const {
    if (worker_.start_timeout.count() < 1000 ||
        worker_.start_timeout.count() > Defaults::START_TIMEOUT_CEILING_MS) {
        throw Errors::invalid_start_timeout(worker_.start_timeout);
    }

    if (worker_.stop_timeout.count() < 1000 || worker_.stop_timeout.count() > 120000) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "stop_timeout",
            "Worker stop timeout must be between 1s and 120s");
    }

    if (worker_.health_check_timeout.count() < 100 || worker_.health_check_timeout.count() > 60000) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "health_check_timeout",
            "Health check timeout must be between 100ms and 60s");
    }

    if (worker_.runtime_binary.empty()) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "runtime_binary",
            "Container runtime binary cannot be empty");
    }

    if (worker_.image.empty()) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "image", "Worker image cannot be empty");
    }

    if (worker_.container_port == 0) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "container_port", "Container port cannot be 0");
    }
}

void Config::validate_port_config() const {
    size_t last = static_cast<size_t>(ports_.base_port) + session_.max_concurrent_sessions;
    if (ports_.base_port == 0 || last > 65536) {
        throw Errors::invalid_port_range(ports_.base_port, session_.max_concurrent_sessions);
    }

    if (ports_.public_host.empty() || !Utils::is_valid_hostname(ports_.public_host)) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "public_host",
            "Public host must be a valid hostname or address, got: '" + ports_.public_host + "'");
    }
}

void Config::validate_server_config() const {
    if (server_.handler_threads == 0 || server_.handler_threads > 256) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "handler_threads",
            "Handler threads must be between 1 and 256");
    }

    if (server_.max_request_bytes < 1024 || server_.max_request_bytes > 16 * 1024 * 1024) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "max_request_bytes",
            "Max request size must be between 1KB and 16MB");
    }

    if (!Utils::starts_with(server_.terminal_proxy_prefix, "/")) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "terminal_proxy_prefix",
            "Terminal proxy prefix must start with '/'");
    }
}

Config Config::development() {
    return Presets::development();
}

Config Config::production() {
    return Presets::production();
}

// ConfigBuilder implementation
ConfigBuilder& ConfigBuilder::sessions(std::chrono::seconds duration, size_t max_concurrent) {
    config_.session_.duration = duration;
    config_.session_.max_concurrent_sessions = max_concurrent;
    return *this;
}

ConfigBuilder& ConfigBuilder::sweep(std::chrono::milliseconds interval) {
    config_.session_.sweep_interval = interval;
    return *this;
}

ConfigBuilder& ConfigBuilder::worker_image(const std::string& image, Port container_port) {
    config_.worker_.image = image;
    config_.worker_.container_port = container_port;
    return *this;
}

ConfigBuilder& ConfigBuilder::worker_limits(const std::string& memory, const std::string& cpus) {
    config_.worker_.memory_limit = memory;
    config_.worker_.cpu_limit = cpus;
    return *this;
}

ConfigBuilder& ConfigBuilder::worker_timeouts(std::chrono::milliseconds start,
                                              std::chrono::milliseconds stop,
                                              std::chrono::milliseconds health_check) {
    config_.worker_.start_timeout = start;
    config_.worker_.stop_timeout = stop;
    config_.worker_.health_check_timeout = health_check;
    return *this;
}

ConfigBuilder& ConfigBuilder::runtime(const std::string& binary) {
    config_.worker_.runtime_binary = binary;
    return *this;
}

ConfigBuilder& ConfigBuilder::port_pool(Port base_port, const std::string& public_host) {
    config_.ports_.base_port = base_port;
    config_.ports_.public_host = public_host;
    return *this;
}

ConfigBuilder& ConfigBuilder::listen(const std::string& bind_address, Port port, size_t handler_threads) {
    config_.server_.bind_address = bind_address;
    config_.server_.listen_port = port;
    config_.server_.handler_threads = handler_threads;
    return *this;
}

ConfigBuilder& ConfigBuilder::admin_secret(const std::string& secret) {
    config_.server_.admin_secret = secret;
    return *this;
}

ConfigBuilder& ConfigBuilder::lead_capture(const std::string& persistence_file, bool require_company_email) {
    config_.leads_.persistence_file = persistence_file;
    config_.leads_.require_company_email = require_company_email;
    return *this;
}

ConfigBuilder& ConfigBuilder::system_logging(SystemLogLevel level, bool console) {
    config_.logging_.level = level;
    config_.logging_.log_to_console = console;
    return *this;
}

ConfigBuilder& ConfigBuilder::file_logging(const std::string& path) {
    config_.logging_.log_to_file = true;
    config_.logging_.log_file_path = path;
    return *this;
}

Config ConfigBuilder::build() const {
    Config config = config_;
    config.validate();
    return config;
}

// EnvConfig implementation
Config EnvConfig::from_environment() {
    Config config;

    if (auto seconds = get_env_int("TL_SESSION_DURATION_SECONDS")) {
        config.set_session_duration(std::chrono::seconds(*seconds));
    }

    if (auto max_sessions = get_env_int("TL_MAX_SESSIONS")) {
        config.set_max_concurrent_sessions(*max_sessions > 0 ? static_cast<size_t>(*max_sessions) : 0);
    }

    if (auto ms = get_env_int("TL_SWEEP_INTERVAL_MS")) {
        config.set_sweep_interval(std::chrono::milliseconds(*ms));
    }

    if (auto ms = get_env_int("TL_START_TIMEOUT_MS")) {
        config.set_start_timeout(std::chrono::milliseconds(*ms));
    }

    if (auto ms = get_env_int("TL_STOP_TIMEOUT_MS")) {
        config.set_stop_timeout(std::chrono::milliseconds(*ms));
    }

    if (auto port = get_env_int("TL_BASE_PORT")) {
        if (*port <= 0 || *port > 65535) {
            throw Errors::invalid_port_range(0, config.session().max_concurrent_sessions);
        }
        config.set_base_port(static_cast<Port>(*port));
    }

    if (auto host = get_env("TL_PUBLIC_HOST")) {
        config.set_public_host(*host);
    }

    auto bind_address = get_env("TL_BIND_ADDRESS").value_or(config.server().bind_address);
    auto listen_port = get_env_int("TL_LISTEN_PORT").value_or(config.server().listen_port);
    if (listen_port <= 0 || listen_port > 65535) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "listen_port",
            "Listen port must be between 1 and 65535, got: " + std::to_string(listen_port));
    }
    config.set_listen(bind_address, static_cast<Port>(listen_port));

    if (auto image = get_env("TL_WORKER_IMAGE")) {
        config.set_worker_image(*image);
    } else if (auto legacy_image = get_env("DEMO_IMAGE")) {
        config.set_worker_image(*legacy_image);
    }

    if (auto runtime = get_env("TL_RUNTIME")) {
        config.set_runtime_binary(*runtime);
    }

    if (auto secret = get_env("TL_ADMIN_SECRET")) {
        config.set_admin_secret(*secret);
    } else if (auto legacy_secret = get_env("ADMIN_SECRET")) {
        config.set_admin_secret(*legacy_secret);
    }

    auto data_dir = get_env("TL_DATA_DIR");
    if (!data_dir) {
        data_dir = get_env("DATA_DIR");
    }
    if (data_dir) {
        std::string dir = *data_dir;
        if (!Utils::ends_with(dir, "/")) {
            dir += "/";
        }
        config.set_lead_file(dir + "leads.json");
    }

    if (auto require = get_env_bool("TL_REQUIRE_COMPANY_EMAIL")) {
        config.require_company_email(*require);
    }

    if (auto level = get_log_level()) {
        config.set_system_log_level(*level);
    }

    if (auto log_file = get_env("TL_LOG_FILE")) {
        config.set_log_to_file(*log_file);
    }

    config.validate();
    return config;
}

std::optional<SystemLogLevel> EnvConfig::get_log_level() {
    if (auto level_str = get_env("TL_LOG_LEVEL")) {
        std::string upper = Utils::to_upper(*level_str);

        if (upper == "NONE") return SystemLogLevel::NONE;
        if (upper == "ERROR") return SystemLogLevel::ERROR;
        if (upper == "WARN" || upper == "WARNING") return SystemLogLevel::WARN;
        if (upper == "INFO") return SystemLogLevel::INFO;
        if (upper == "DEBUG") return SystemLogLevel::DEBUG;
        if (upper == "TRACE") return SystemLogLevel::TRACE;
    }
    return std::nullopt;
}

std::optional<std::string> EnvConfig::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value && strlen(value) > 0) {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<int64_t> EnvConfig::get_env_int(const std::string& name) {
    if (auto str = get_env(name)) {
        try {
            return std::stoll(*str);
        } catch (const std::exception&) {
            throw ConfigError(ErrorCode::INVALID_CONFIG, name,
                "Expected an integer, got: '" + *str + "'");
        }
    }
    return std::nullopt;
}

std::optional<bool> EnvConfig::get_env_bool(const std::string& name) {
    if (auto str = get_env(name)) {
        std::string lower = Utils::to_lower(*str);
        return (lower == "true" || lower == "1" || lower == "yes" || lower == "on");
    }
    return std::nullopt;
}

} // namespace termlease
