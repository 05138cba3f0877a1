// tests/test_foundation.cpp
// Unit tests for the foundation layer: types, errors, configuration, utilities and logging

#include <gtest/gtest.h>
#include "termlease/termlease.hpp"
#include "termlease/utils.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <unistd.h>

using namespace termlease;

class FoundationTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear_environment();
    }

    void TearDown() override {
        clear_environment();
    }

    static void clear_environment() {
        for (const char* name : {"TL_SESSION_DURATION_SECONDS", "TL_MAX_SESSIONS", "TL_SWEEP_INTERVAL_MS",
                                 "TL_START_TIMEOUT_MS", "TL_STOP_TIMEOUT_MS", "TL_BASE_PORT",
                                 "TL_PUBLIC_HOST", "TL_BIND_ADDRESS", "TL_LISTEN_PORT", "TL_WORKER_IMAGE",
                                 "DEMO_IMAGE", "TL_RUNTIME", "TL_ADMIN_SECRET", "ADMIN_SECRET",
                                 "TL_DATA_DIR", "DATA_DIR", "TL_REQUIRE_COMPANY_EMAIL", "TL_LOG_LEVEL",
                                 "TL_LOG_FILE"}) {
            unsetenv(name);
        }
    }
};

// Tests for types and enums
TEST_F(FoundationTest, TestSessionStateStrings) {
    EXPECT_EQ(Utils::session_state_to_string(SessionState::PROVISIONING), "provisioning");
    EXPECT_EQ(Utils::session_state_to_string(SessionState::RUNNING), "running");
    EXPECT_EQ(Utils::session_state_to_string(SessionState::EXPIRING), "expiring");
    EXPECT_EQ(Utils::session_state_to_string(SessionState::TERMINATED), "terminated");

    EXPECT_EQ(Utils::termination_cause_to_string(TerminationCause::EXPIRED), "expired");
    EXPECT_EQ(Utils::termination_cause_to_string(TerminationCause::CRASHED), "crashed");
    EXPECT_EQ(Utils::termination_cause_to_string(TerminationCause::START_FAILED), "start_failed");
}

TEST_F(FoundationTest, TestSessionRemainingSeconds) {
    Session session;
    session.state = SessionState::RUNNING;
    session.expires_at = 10000;

    EXPECT_EQ(session.remaining_seconds(4500), 5);
    EXPECT_EQ(session.remaining_seconds(10000), 0);
    EXPECT_EQ(session.remaining_seconds(20000), 0);
    EXPECT_TRUE(session.is_active());

    session.state = SessionState::TERMINATED;
    EXPECT_EQ(session.remaining_seconds(0), 0);
    EXPECT_FALSE(session.is_active());
}

TEST_F(FoundationTest, TestSessionIdGeneration) {
    const std::string alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::set<SessionId> seen;
    for (int i = 0; i < 1000; ++i) {
        SessionId id = Utils::generate_session_id();
        EXPECT_EQ(id.size(), 22u);
        EXPECT_EQ(id.find_first_not_of(alphabet), std::string::npos) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 1000u);
}

// Tests for the error system
TEST_F(FoundationTest, TestErrorCodesAndCategory) {
    std::error_code ec = ErrorCode::SESSION_NOT_FOUND;
    EXPECT_EQ(std::string(ec.category().name()), "termlease");
    EXPECT_EQ(ec.message(), "Session not found");
    EXPECT_EQ(ec.value(), 400);

    std::error_code capacity = make_error_code(ErrorCode::CAPACITY_EXCEEDED);
    EXPECT_EQ(capacity.message(), "Capacity exceeded");
}

TEST_F(FoundationTest, TestErrorFactories) {
    auto capacity = Errors::capacity_exceeded(10);
    EXPECT_EQ(capacity.code(), ErrorCode::CAPACITY_EXCEEDED);
    EXPECT_EQ(capacity.limit(), 10u);
    EXPECT_EQ(capacity.category(), "termlease::CapacityError");
    EXPECT_STREQ(capacity.what(),
                 "All demo slots are currently in use. Please try again in a few minutes.");

    auto blocked = Errors::blocked_email_domain("gmail.com");
    EXPECT_EQ(blocked.code(), ErrorCode::BLOCKED_EMAIL_DOMAIN);
    EXPECT_EQ(blocked.field(), "email");
    EXPECT_STREQ(blocked.what(), "Please use your company email address");

    auto invalid = Errors::invalid_email("not-an-email");
    EXPECT_EQ(invalid.value(), "not-an-email");

    auto start = Errors::start_failure("abcdefghijklmnop", "image not found");
    EXPECT_EQ(start.code(), ErrorCode::START_FAILURE);
    EXPECT_EQ(start.operation(), "start");
    EXPECT_NE(std::string(start.what()).find("abcdefgh"), std::string::npos);
    EXPECT_EQ(std::string(start.what()).find("ijklmnop"), std::string::npos);

    auto missing = Errors::session_not_found("some-id");
    EXPECT_EQ(missing.session_id(), "some-id");
    EXPECT_EQ(missing.category(), "termlease::NotFoundError");

    EXPECT_EQ(Errors::unauthorized().code(), ErrorCode::UNAUTHORIZED);
}

TEST_F(FoundationTest, TestErrorHierarchy) {
    try {
        throw Errors::teardown_failure("container-123", "daemon unreachable");
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::TEARDOWN_FAILURE);
        EXPECT_EQ(e.category(), "termlease::WorkerError");
    }

    EXPECT_THROW(throw Errors::invalid_capacity(0), ConfigError);
    EXPECT_THROW(throw Errors::port_exhausted(2), CapacityError);
}

// Tests for configuration
TEST_F(FoundationTest, TestDefaultConfigIsValid) {
    Config config;
    EXPECT_TRUE(config.is_valid());
    EXPECT_NO_THROW(config.validate());

    EXPECT_EQ(config.session().duration, std::chrono::seconds(900));
    EXPECT_EQ(config.session().max_concurrent_sessions, 10u);
    EXPECT_EQ(config.ports().base_port, 7700);
    EXPECT_EQ(config.worker().container_port, 7681);
    EXPECT_EQ(config.worker().image, "autonops/infraiq-demo:latest");
    EXPECT_EQ(config.worker().memory_limit, "512m");
    EXPECT_EQ(config.worker().cpu_limit, "0.5");
    EXPECT_EQ(config.server().listen_port, 8000);
    EXPECT_TRUE(config.leads().require_company_email);
    EXPECT_TRUE(config.server().admin_secret.empty());
}

TEST_F(FoundationTest, TestConfigValidationErrors) {
    Config config;
    config.set_session_duration(std::chrono::seconds(5));
    auto errors = config.validation_errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("Session duration"), std::string::npos);

    try {
        config.validate();
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_CONFIG);
    }

    Config zero_capacity;
    zero_capacity.set_max_concurrent_sessions(0);
    EXPECT_FALSE(zero_capacity.is_valid());

    Config bad_range;
    bad_range.set_base_port(65530);
    EXPECT_FALSE(bad_range.is_valid());

    Config bad_host;
    bad_host.set_public_host("not a host");
    EXPECT_FALSE(bad_host.is_valid());

    Config bad_timeout;
    bad_timeout.set_start_timeout(std::chrono::milliseconds(500));
    EXPECT_FALSE(bad_timeout.is_valid());
}

TEST_F(FoundationTest, TestConfigBuilder) {
    Config config = ConfigBuilder()
        .sessions(std::chrono::seconds(60), 3)
        .sweep(std::chrono::milliseconds(500))
        .port_pool(9000, "localhost")
        .worker_image("example/terminal:1", 7000)
        .admin_secret("s3cret")
        .build();

    EXPECT_EQ(config.session().duration, std::chrono::seconds(60));
    EXPECT_EQ(config.session().max_concurrent_sessions, 3u);
    EXPECT_EQ(config.ports().base_port, 9000);
    EXPECT_EQ(config.ports().public_host, "localhost");
    EXPECT_EQ(config.worker().container_port, 7000);
    EXPECT_EQ(config.server().admin_secret, "s3cret");

    EXPECT_THROW(ConfigBuilder().sessions(std::chrono::seconds(60), 0).build(), ConfigError);
}

TEST_F(FoundationTest, TestConfigBuilderWorkerAndLogging) {
    Config config = ConfigBuilder()
        .worker_limits("1g", "1.5")
        .worker_timeouts(std::chrono::milliseconds(30000), std::chrono::milliseconds(10000),
                         std::chrono::milliseconds(3000))
        .runtime("podman")
        .listen("127.0.0.1", 8081, 2)
        .lead_capture("/tmp/tl-leads.json", false)
        .system_logging(SystemLogLevel::WARN, false)
        .file_logging("/tmp/termleased.log")
        .build();

    EXPECT_EQ(config.worker().memory_limit, "1g");
    EXPECT_EQ(config.worker().cpu_limit, "1.5");
    EXPECT_EQ(config.worker().start_timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(config.worker().stop_timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(config.worker().health_check_timeout, std::chrono::milliseconds(3000));
    EXPECT_EQ(config.worker().runtime_binary, "podman");
    EXPECT_EQ(config.server().bind_address, "127.0.0.1");
    EXPECT_EQ(config.server().listen_port, 8081);
    EXPECT_EQ(config.server().handler_threads, 2u);
    EXPECT_EQ(config.leads().persistence_file, "/tmp/tl-leads.json");
    EXPECT_FALSE(config.leads().require_company_email);
    EXPECT_EQ(config.logging().level, SystemLogLevel::WARN);
    EXPECT_FALSE(config.logging().log_to_console);
    EXPECT_TRUE(config.logging().log_to_file);
    EXPECT_EQ(config.logging().log_file_path, "/tmp/termleased.log");
}

TEST_F(FoundationTest, TestConfigSetters) {
    Config config;
    config.set_sweep_interval(std::chrono::milliseconds(250))
          .set_tombstone_retention(std::chrono::seconds(30))
          .set_stop_timeout(std::chrono::milliseconds(4000))
          .set_worker_image("example/terminal:2")
          .set_runtime_binary("/usr/local/bin/docker")
          .set_worker_env("TERM", "xterm-256color")
          .set_listen("127.0.0.1", 9090)
          .set_admin_secret("hunter2")
          .set_lead_file("/tmp/leads.json")
          .set_system_log_level(SystemLogLevel::DEBUG)
          .set_log_to_file("/tmp/tl.log");

    EXPECT_TRUE(config.is_valid());
    EXPECT_EQ(config.session().sweep_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(config.session().tombstone_retention, std::chrono::seconds(30));
    EXPECT_EQ(config.worker().stop_timeout, std::chrono::milliseconds(4000));
    EXPECT_EQ(config.worker().image, "example/terminal:2");
    EXPECT_EQ(config.worker().runtime_binary, "/usr/local/bin/docker");
    EXPECT_EQ(config.worker().environment.at("TERM"), "xterm-256color");
    EXPECT_EQ(config.server().listen_port, 9090);
    EXPECT_EQ(config.server().admin_secret, "hunter2");
    EXPECT_EQ(config.leads().persistence_file, "/tmp/leads.json");
    EXPECT_EQ(config.logging().level, SystemLogLevel::DEBUG);
    EXPECT_EQ(config.logging().log_file_path, "/tmp/tl.log");

    config.set_stop_timeout(std::chrono::milliseconds(0));
    EXPECT_FALSE(config.is_valid());
}

TEST_F(FoundationTest, TestPresets) {
    Config dev = Presets::development();
    EXPECT_EQ(dev.session().max_concurrent_sessions, 2u);
    EXPECT_FALSE(dev.leads().require_company_email);
    EXPECT_EQ(dev.logging().level, SystemLogLevel::DEBUG);

    Config prod = Config::production();
    EXPECT_EQ(prod.session().max_concurrent_sessions, 10u);
    EXPECT_EQ(prod.leads().persistence_file, "/data/leads.json");
}

TEST_F(FoundationTest, TestEnvironmentConfig) {
    setenv("TL_MAX_SESSIONS", "3", 1);
    setenv("TL_SESSION_DURATION_SECONDS", "120", 1);
    setenv("DATA_DIR", "/tmp/tl-data", 1);
    setenv("ADMIN_SECRET", "legacy-secret", 1);
    setenv("TL_REQUIRE_COMPANY_EMAIL", "false", 1);
    setenv("TL_LOG_LEVEL", "debug", 1);
    setenv("DEMO_IMAGE", "legacy/image:1", 1);
    setenv("TL_WORKER_IMAGE", "current/image:2", 1);

    Config config = EnvConfig::from_environment();
    EXPECT_EQ(config.session().max_concurrent_sessions, 3u);
    EXPECT_EQ(config.session().duration, std::chrono::seconds(120));
    EXPECT_EQ(config.leads().persistence_file, "/tmp/tl-data/leads.json");
    EXPECT_EQ(config.server().admin_secret, "legacy-secret");
    EXPECT_FALSE(config.leads().require_company_email);
    EXPECT_EQ(config.logging().level, SystemLogLevel::DEBUG);
    EXPECT_EQ(config.worker().image, "current/image:2");
}

TEST_F(FoundationTest, TestEnvironmentConfigRejectsBadValues) {
    setenv("TL_MAX_SESSIONS", "many", 1);
    EXPECT_THROW(EnvConfig::from_environment(), ConfigError);

    unsetenv("TL_MAX_SESSIONS");
    setenv("TL_SESSION_DURATION_SECONDS", "1", 1);
    EXPECT_THROW(EnvConfig::from_environment(), ConfigError);

    unsetenv("TL_SESSION_DURATION_SECONDS");
    setenv("TL_LISTEN_PORT", "70000", 1);
    EXPECT_THROW(EnvConfig::from_environment(), ConfigError);
}

// Tests for utility functions
TEST_F(FoundationTest, TestStringUtils) {
    EXPECT_EQ(Utils::trim("  hello \n"), "hello");
    EXPECT_EQ(Utils::trim("   "), "");
    EXPECT_EQ(Utils::to_lower("MiXeD"), "mixed");
    EXPECT_EQ(Utils::to_upper("warn"), "WARN");

    EXPECT_TRUE(Utils::starts_with("/api/session", "/api/"));
    EXPECT_FALSE(Utils::starts_with("/ap", "/api/"));
    EXPECT_TRUE(Utils::ends_with("leads.json", ".json"));
}

TEST_F(FoundationTest, TestEmailUtils) {
    EXPECT_EQ(Utils::normalize_email("  Jane@ACME.io \n"), "jane@acme.io");

    EXPECT_TRUE(Utils::is_valid_email("jane@acme.io"));
    EXPECT_TRUE(Utils::is_valid_email("first.last+demo@sub.example.co"));
    EXPECT_FALSE(Utils::is_valid_email(""));
    EXPECT_FALSE(Utils::is_valid_email("jane@acme"));
    EXPECT_FALSE(Utils::is_valid_email("no-at-sign.com"));
    EXPECT_FALSE(Utils::is_valid_email("a b@acme.io"));
    EXPECT_FALSE(Utils::is_valid_email("jane@@acme.io"));
    EXPECT_FALSE(Utils::is_valid_email(std::string(250, 'a') + "@acme.io"));

    EXPECT_EQ(Utils::email_domain("jane@acme.io"), "acme.io");
    EXPECT_EQ(Utils::email_domain("nodomain"), "");
}

TEST_F(FoundationTest, TestNetworkUtils) {
    EXPECT_TRUE(Utils::is_valid_hostname("localhost"));
    EXPECT_TRUE(Utils::is_valid_hostname("127.0.0.1"));
    EXPECT_TRUE(Utils::is_valid_hostname("demo.example.com"));
    EXPECT_FALSE(Utils::is_valid_hostname(""));
    EXPECT_FALSE(Utils::is_valid_hostname("-bad.example.com"));
}

TEST_F(FoundationTest, TestTimestampFormatting) {
    EXPECT_EQ(Utils::timestamp_to_iso8601(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(Utils::timestamp_to_iso8601(1700000000123ULL), "2023-11-14T22:13:20.123Z");
}

TEST_F(FoundationTest, TestFileUtils) {
    EXPECT_EQ(Utils::parent_directory("/data/leads.json"), "/data");
    EXPECT_EQ(Utils::parent_directory("/leads.json"), "/");
    EXPECT_EQ(Utils::parent_directory("leads.json"), "");

    std::string base = "/tmp/tl-foundation-" + std::to_string(getpid());
    std::string nested = base + "/a/b";
    EXPECT_TRUE(Utils::create_directories(nested));
    EXPECT_TRUE(Utils::create_directories(nested));

    // rmdir only succeeds on directories
    EXPECT_EQ(rmdir(nested.c_str()), 0);
    EXPECT_EQ(rmdir((base + "/a").c_str()), 0);
    EXPECT_EQ(rmdir(base.c_str()), 0);
}

// Tests for the logger
TEST_F(FoundationTest, TestLoggerFileSink) {
    std::string path = "/tmp/tl-logger-" + std::to_string(getpid()) + ".log";
    std::remove(path.c_str());

    LoggingConfig logging;
    logging.level = SystemLogLevel::INFO;
    logging.log_to_console = false;
    logging.log_to_file = true;
    logging.log_file_path = path;

    Logger& logger = Logger::instance();
    logger.configure(logging);

    EXPECT_TRUE(logger.should_log(SystemLogLevel::WARN));
    EXPECT_FALSE(logger.should_log(SystemLogLevel::DEBUG));
    EXPECT_FALSE(logger.should_log(SystemLogLevel::NONE));

    TL_LOG_INFO("test", "hello " << 42);
    TL_LOG_DEBUG("test", "suppressed");
    logger.shutdown();

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("[INFO] test: hello 42"), std::string::npos);
    EXPECT_EQ(contents.str().find("suppressed"), std::string::npos);

    // Restore a quiet console logger for the remaining tests
    LoggingConfig quiet;
    quiet.level = SystemLogLevel::ERROR;
    logger.configure(quiet);
    std::remove(path.c_str());
}
