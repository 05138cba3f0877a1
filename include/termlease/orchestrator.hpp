// include/termlease/orchestrator.hpp
// Purpose: Orchestrator facade - create, query, delete and export under the capacity gate
// Composes the registry, port pool, worker driver, supervisor and lead store

#pragma once

#include "config.hpp"
#include "session.hpp"
#include "port_allocator.hpp"
#include "worker_driver.hpp"
#include "supervisor.hpp"
#include "lead_store.hpp"
#include "observability.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace termlease {

class Orchestrator {
public:
    using SessionCreatedCallback = std::function<void(const Session&)>;
    using SessionTerminatedCallback = LifecycleSupervisor::SessionTerminatedCallback;

    // Throws ConfigError if the configuration is invalid
    Orchestrator(const Config& config,
                 std::shared_ptr<WorkerDriver> driver,
                 std::shared_ptr<LeadStore> leads = std::make_shared<MemoryLeadStore>(),
                 Clock clock = Utils::now_milliseconds);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Start the background sweep
    void start();

    // Stop the sweep, refuse new sessions and tear down every active session
    void stop();
    bool is_running() const { return running_; }

    // Admit, allocate and start a session. Throws ValidationError, CapacityError
    // or WorkerError; anything acquired is released before the error propagates.
    SessionGrant create_session(const std::string& email, const std::string& client_address = "");

    // Throws NotFoundError for unknown or purged ids
    SessionStatus get_session(const SessionId& id) const;

    // Idempotent. Returns once the session is terminated or handed to the sweep.
    // Throws NotFoundError for unknown ids.
    void delete_session(const SessionId& id);

    // Throws AuthError unless `credential` matches the configured admin secret
    std::vector<Lead> export_leads(const std::string& credential) const;

    HealthReport health() const;

    // Reverse proxy path for a running session, e.g. "/t/7700/".
    // Throws NotFoundError(SESSION_NOT_RUNNING) once the session has expired;
    // an overdue session is torn down on the spot.
    std::string terminal_target(const SessionId& id);

    void set_session_created_callback(SessionCreatedCallback callback);
    void set_session_terminated_callback(SessionTerminatedCallback callback);

    const Config& config() const noexcept { return config_; }
    SessionRegistry& registry() noexcept { return registry_; }
    PortAllocator& ports() noexcept { return ports_; }
    LifecycleSupervisor& supervisor() noexcept { return supervisor_; }
    MetricsRegistry& metrics() noexcept { return metrics_; }
    const MetricsRegistry& metrics() const noexcept { return metrics_; }

private:
    Config config_;
    Clock clock_;
    std::shared_ptr<WorkerDriver> driver_;
    std::shared_ptr<LeadStore> leads_;
    MetricsRegistry metrics_;
    SessionRegistry registry_;
    PortAllocator ports_;
    LifecycleSupervisor supervisor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    std::mutex callback_mutex_;
    SessionCreatedCallback session_created_callback_;

    std::string validate_email(const std::string& email) const;
    SessionId unique_session_id() const;
    void notify_created(const Session& session);
};

} // namespace termlease
