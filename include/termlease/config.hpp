// include/termlease/config.hpp
// Purpose: Configuration system for the termlease orchestrator
// Defaults mirror the original single-host demo deployment

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <string>
#include <chrono>
#include <vector>
#include <optional>

namespace termlease {

// Session lifetime and admission
struct SessionConfig {
    std::chrono::seconds duration{Defaults::SESSION_DURATION_SECONDS};
    size_t max_concurrent_sessions = Defaults::MAX_CONCURRENT_SESSIONS;  // also the port pool size
    std::chrono::milliseconds sweep_interval{Defaults::SWEEP_INTERVAL_MS};
    std::chrono::seconds tombstone_retention{Defaults::TOMBSTONE_RETENTION_SECONDS};
};

// Container runtime invocation
struct WorkerConfig {
    std::string runtime_binary = "docker";
    std::string image = Defaults::WORKER_IMAGE;
    std::string container_prefix = Defaults::CONTAINER_PREFIX;
    Port container_port = Defaults::CONTAINER_PORT;  // port the terminal listens on inside the container
    std::string memory_limit = Defaults::MEMORY_LIMIT;
    std::string cpu_limit = Defaults::CPU_LIMIT;
    std::chrono::milliseconds start_timeout{Defaults::START_TIMEOUT_MS};
    std::chrono::milliseconds stop_timeout{Defaults::STOP_TIMEOUT_MS};
    std::chrono::milliseconds health_check_timeout{Defaults::HEALTH_CHECK_TIMEOUT_MS};
    Environment environment;  // extra -e KEY=VALUE pairs
};

// Host ports handed to sessions
struct PortConfig {
    Port base_port = Defaults::BASE_PORT;
    std::string public_host = "127.0.0.1";  // host the reverse proxy dials
};

// HTTP front end
struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    Port listen_port = Defaults::LISTEN_PORT;
    size_t handler_threads = 4;
    size_t max_request_bytes = 64 * 1024;
    std::chrono::milliseconds receive_timeout{10000};
    std::string admin_secret;  // empty disables lead export
    std::string terminal_proxy_prefix = "/t/";
};

// Lead capture
struct LeadConfig {
    std::string persistence_file;  // empty keeps leads in memory only
    bool require_company_email = true;
    std::vector<std::string> blocked_email_domains{
        "gmail.com", "yahoo.com", "hotmail.com", "outlook.com", "aol.com",
        "icloud.com", "mail.com", "protonmail.com", "zoho.com", "yandex.com",
        "gmx.com", "live.com", "msn.com", "me.com", "inbox.com"
    };
};

// Logging configuration (orchestrator internal logging)
enum class SystemLogLevel : uint8_t {
    NONE = 0,       // No logging
    ERROR = 1,      // Only errors
    WARN = 2,       // Warnings and errors
    INFO = 3,       // Informational + above
    DEBUG = 4,      // Debug + above
    TRACE = 5       // Everything
};

struct LoggingConfig {
    SystemLogLevel level = SystemLogLevel::INFO;
    bool log_to_console = true;
    bool log_to_file = false;
    std::string log_file_path;
};

// Main configuration class
class Config {
public:
    Config() = default;

    // Getters
    const SessionConfig& session() const noexcept { return session_; }
    const WorkerConfig& worker() const noexcept { return worker_; }
    const PortConfig& ports() const noexcept { return ports_; }
    const ServerConfig& server() const noexcept { return server_; }
    const LeadConfig& leads() const noexcept { return leads_; }
    const LoggingConfig& logging() const noexcept { return logging_; }

    // Setters (fluent interface)
    Config& set_session_duration(std::chrono::seconds duration);
    Config& set_max_concurrent_sessions(size_t max_sessions);
    Config& set_sweep_interval(std::chrono::milliseconds interval);
    Config& set_tombstone_retention(std::chrono::seconds retention);
    Config& set_start_timeout(std::chrono::milliseconds timeout);
    Config& set_stop_timeout(std::chrono::milliseconds timeout);
    Config& set_worker_image(const std::string& image);
    Config& set_runtime_binary(const std::string& binary);
    Config& set_worker_env(const std::string& key, const std::string& value);
    Config& set_base_port(Port port);
    Config& set_public_host(const std::string& host);
    Config& set_listen(const std::string& bind_address, Port port);
    Config& set_admin_secret(const std::string& secret);
    Config& set_lead_file(const std::string& path);
    Config& require_company_email(bool require = true);
    Config& set_system_log_level(SystemLogLevel level);
    Config& set_log_to_file(const std::string& path);

    // Validation
    void validate() const;
    bool is_valid() const noexcept;
    std::vector<std::string> validation_errors() const;

    // Preset configurations
    static Config development();
    static Config production();

    friend class ConfigBuilder;

private:
    SessionConfig session_;
    WorkerConfig worker_;
    PortConfig ports_;
    ServerConfig server_;
    LeadConfig leads_;
    LoggingConfig logging_;

    void validate_session_config() const;
    void validate_worker_config() const;
    void validate_port_config() const;
    void validate_server_config() const;
};

// Configuration builder for advanced use cases
class ConfigBuilder {
public:
    ConfigBuilder() = default;

    ConfigBuilder& sessions(std::chrono::seconds duration, size_t max_concurrent);
    ConfigBuilder& sweep(std::chrono::milliseconds interval);
    ConfigBuilder& worker_image(const std::string& image, Port container_port);
    ConfigBuilder& worker_limits(const std::string& memory, const std::string& cpus);
    ConfigBuilder& worker_timeouts(std::chrono::milliseconds start,
                                   std::chrono::milliseconds stop,
                                   std::chrono::milliseconds health_check);
    ConfigBuilder& runtime(const std::string& binary);
    ConfigBuilder& port_pool(Port base_port, const std::string& public_host);
    ConfigBuilder& listen(const std::string& bind_address, Port port, size_t handler_threads = 4);
    ConfigBuilder& admin_secret(const std::string& secret);
    ConfigBuilder& lead_capture(const std::string& persistence_file, bool require_company_email);
    ConfigBuilder& system_logging(SystemLogLevel level, bool console = true);
    ConfigBuilder& file_logging(const std::string& path);

    // Build final configuration
    Config build() const;

private:
    Config config_;
};

// Environment variable configuration loader
class EnvConfig {
public:
    // Apply TL_* variables (and the legacy DATA_DIR, DEMO_IMAGE, ADMIN_SECRET)
    // on top of the defaults; throws ConfigError if the result is invalid
    static Config from_environment();

    static std::optional<SystemLogLevel> get_log_level();

private:
    static std::optional<std::string> get_env(const std::string& name);
    static std::optional<int64_t> get_env_int(const std::string& name);
    static std::optional<bool> get_env_bool(const std::string& name);
};

// Configuration presets namespace
namespace Presets {

// Development configuration - short sessions, verbose logging, no domain filter
inline Config development() {
    return ConfigBuilder()
        .sessions(std::chrono::minutes(5), 2)
        .sweep(std::chrono::seconds(5))
        .lead_capture("", false)
        .listen("127.0.0.1", Defaults::LISTEN_PORT, 2)
        .system_logging(SystemLogLevel::DEBUG)
        .build();
}

// Production configuration - the original deployment's limits
inline Config production() {
    return ConfigBuilder()
        .sessions(std::chrono::seconds(Defaults::SESSION_DURATION_SECONDS), Defaults::MAX_CONCURRENT_SESSIONS)
        .sweep(std::chrono::milliseconds(Defaults::SWEEP_INTERVAL_MS))
        .lead_capture("/data/leads.json", true)
        .system_logging(SystemLogLevel::INFO)
        .build();
}

} // namespace Presets

} // namespace termlease
