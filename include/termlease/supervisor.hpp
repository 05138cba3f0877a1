// include/termlease/supervisor.hpp
// Purpose: Background enforcement of session deadlines and worker liveness
// Owns the single teardown path: stop worker, then remove the record and free its port together

#pragma once

#include "session.hpp"
#include "port_allocator.hpp"
#include "worker_driver.hpp"
#include "observability.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace termlease {

enum class TeardownResult {
    COMPLETED = 0,      // this caller released the worker, port and slot
    NOT_OWNER = 1,      // already terminated, in progress elsewhere, or still provisioning
    FAILED = 2          // worker stop failed; the sweep will retry
};

// Outcome of one sweep pass
struct SweepStats {
    size_t examined = 0;
    size_t expired = 0;
    size_t crashed = 0;
    size_t retried = 0;
    size_t failures = 0;
    size_t purged = 0;
};

class LifecycleSupervisor {
public:
    using SessionTerminatedCallback = std::function<void(const Session&)>;

    LifecycleSupervisor(SessionRegistry& registry,
                        PortAllocator& ports,
                        WorkerDriver& driver,
                        MetricsRegistry& metrics,
                        std::chrono::milliseconds sweep_interval);
    ~LifecycleSupervisor();

    LifecycleSupervisor(const LifecycleSupervisor&) = delete;
    LifecycleSupervisor& operator=(const LifecycleSupervisor&) = delete;

    // Sweep thread management; stop() wakes the thread immediately
    void start();
    void stop();
    bool is_running() const { return running_; }

    // One full pass over a snapshot of the active set
    SweepStats sweep_once();

    // Tear down running sessions whose deadline has passed, without waiting
    // for the next pass. Returns the number this call terminated.
    size_t expire_due();

    // Idempotent teardown; throws NotFoundError for unknown ids
    TeardownResult teardown(const SessionId& id, TerminationCause cause);

    // Tear down every active session; returns the number that could not be stopped
    size_t shutdown_all();

    void set_session_terminated_callback(SessionTerminatedCallback callback);

    Timestamp last_sweep_at() const { return last_sweep_at_.load(); }
    std::chrono::milliseconds sweep_interval() const { return sweep_interval_; }

private:
    SessionRegistry& registry_;
    PortAllocator& ports_;
    WorkerDriver& driver_;
    MetricsRegistry& metrics_;
    std::chrono::milliseconds sweep_interval_;

    std::atomic<bool> running_{false};
    std::thread sweep_thread_;
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    std::atomic<Timestamp> last_sweep_at_{0};

    std::mutex callback_mutex_;
    SessionTerminatedCallback session_terminated_callback_;

    void sweep_loop();
    void record_termination(const Session& session);
    void update_active_gauge();
};

} // namespace termlease
