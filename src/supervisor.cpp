// src/supervisor.cpp
// Implementation of the lifecycle supervisor

#include "termlease/supervisor.hpp"
#include "termlease/logger.hpp"
#include "termlease/utils.hpp"

namespace termlease {

namespace {
constexpr const char* LOG_COMPONENT = "supervisor";

std::string short_id(const SessionId& id) {
    return id.substr(0, 8);
}
}

LifecycleSupervisor::LifecycleSupervisor(SessionRegistry& registry,
                                         PortAllocator& ports,
                                         WorkerDriver& driver,
                                         MetricsRegistry& metrics,
                                         std::chrono::milliseconds sweep_interval)
    : registry_(registry)
    , ports_(ports)
    , driver_(driver)
    , metrics_(metrics)
    , sweep_interval_(sweep_interval) {
    metrics_.counter(Metrics::SWEEPS_TOTAL);
    metrics_.counter(Metrics::TEARDOWN_FAILURES);
    metrics_.counter(Metrics::SESSIONS_TERMINATED_EXPIRED);
    metrics_.counter(Metrics::SESSIONS_TERMINATED_DELETED);
    metrics_.counter(Metrics::SESSIONS_TERMINATED_CRASHED);
    metrics_.gauge(Metrics::SESSIONS_ACTIVE);
    metrics_.histogram(Metrics::SWEEP_DURATION_MS);
}

LifecycleSupervisor::~LifecycleSupervisor() {
    stop();
}

void LifecycleSupervisor::start() {
    if (running_.exchange(true)) {
        return; // Already running
    }

    sweep_thread_ = std::thread(&LifecycleSupervisor::sweep_loop, this);
    TL_LOG_INFO(LOG_COMPONENT, "Sweep started, interval " << sweep_interval_.count() << "ms");
}

void LifecycleSupervisor::stop() {
    if (!running_.exchange(false)) {
        return; // Already stopped
    }

    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
    }
    sweep_cv_.notify_all();

    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
    TL_LOG_INFO(LOG_COMPONENT, "Sweep stopped");
}

void LifecycleSupervisor::sweep_loop() {
    while (running_) {
        sweep_once();

        std::unique_lock<std::mutex> lock(sweep_mutex_);
        sweep_cv_.wait_for(lock, sweep_interval_, [this] { return !running_; });
    }
}

SweepStats LifecycleSupervisor::sweep_once() {
    ServerTimer timer(metrics_.histogram(Metrics::SWEEP_DURATION_MS));
    SweepStats stats;

    for (const Session& session : registry_.list_active()) {
        ++stats.examined;
        try {
            switch (session.state) {
                case SessionState::PROVISIONING:
                    // create_session owns it until the worker is up
                    break;

                case SessionState::EXPIRING:
                    // A previous teardown failed or was interrupted
                    if (!registry_.teardown_in_progress(session.id)) {
                        ++stats.retried;
                        if (teardown(session.id, TerminationCause::EXPIRED) == TeardownResult::FAILED) {
                            ++stats.failures;
                        }
                    }
                    break;

                case SessionState::RUNNING:
                    if (registry_.now() >= session.expires_at) {
                        TL_LOG_INFO(LOG_COMPONENT, "Session " << short_id(session.id) << " expired");
                        ++stats.expired;
                        if (teardown(session.id, TerminationCause::EXPIRED) == TeardownResult::FAILED) {
                            ++stats.failures;
                        }
                    } else if (!driver_.is_alive(session.worker_ref)) {
                        // A delete may have won the claim while the probe ran
                        TeardownResult result = teardown(session.id, TerminationCause::CRASHED);
                        if (result == TeardownResult::NOT_OWNER) {
                            break;
                        }
                        TL_LOG_WARN(LOG_COMPONENT, "Worker for session " << short_id(session.id)
                                    << " is gone, terminating");
                        ++stats.crashed;
                        if (result == TeardownResult::FAILED) {
                            ++stats.failures;
                        }
                    }
                    break;

                case SessionState::TERMINATED:
                    break;
            }
        } catch (const NotFoundError&) {
            // Removed by a concurrent teardown after the snapshot was taken
        } catch (const WorkerError& e) {
            // Inconclusive probe: never tear down on it, look again next pass
            TL_LOG_WARN(LOG_COMPONENT, "Session " << short_id(session.id) << ": " << e.what());
        } catch (const std::exception& e) {
            ++stats.failures;
            TL_LOG_ERROR(LOG_COMPONENT, "Sweep failed for session " << short_id(session.id)
                         << ": " << e.what());
        }
    }

    stats.purged = registry_.purge_tombstones(registry_.now());

    metrics_.counter(Metrics::SWEEPS_TOTAL)->increment();
    update_active_gauge();
    last_sweep_at_.store(Utils::now_milliseconds());

    if (stats.expired || stats.crashed || stats.retried || stats.failures) {
        TL_LOG_DEBUG(LOG_COMPONENT, "Sweep: examined=" << stats.examined << " expired=" << stats.expired
                     << " crashed=" << stats.crashed << " retried=" << stats.retried
                     << " failures=" << stats.failures << " purged=" << stats.purged);
    }
    return stats;
}

size_t LifecycleSupervisor::expire_due() {
    size_t expired = 0;
    Timestamp now = registry_.now();
    for (const Session& session : registry_.list_active()) {
        if (session.state != SessionState::RUNNING || now < session.expires_at) {
            continue;
        }
        try {
            if (teardown(session.id, TerminationCause::EXPIRED) == TeardownResult::COMPLETED) {
                ++expired;
            }
        } catch (const NotFoundError&) {
            // Finished by another caller
        }
    }

    if (expired > 0) {
        TL_LOG_INFO(LOG_COMPONENT, "Expired " << expired << " overdue session(s) ahead of the sweep");
    }
    return expired;
}

TeardownResult LifecycleSupervisor::teardown(const SessionId& id, TerminationCause cause) {
    std::optional<Session> claim = registry_.begin_teardown(id, cause);
    if (!claim) {
        return TeardownResult::NOT_OWNER;
    }

    if (!claim->worker_ref.empty()) {
        try {
            driver_.stop(claim->worker_ref);
        } catch (const Error& e) {
            registry_.abandon_teardown(id);
            metrics_.counter(Metrics::TEARDOWN_FAILURES)->increment();
            TL_LOG_WARN(LOG_COMPONENT, "Teardown of session " << short_id(id) << " failed (attempt "
                        << claim->teardown_attempts + 1 << "), will retry: " << e.what());
            return TeardownResult::FAILED;
        }
    }

    // The port is freed inside remove(), so no new session can take it
    // while this record is still active
    registry_.remove(id, [this](const Session& removed) { ports_.release(removed.port); });

    Session terminated = *claim;
    terminated.state = SessionState::TERMINATED;
    terminated.terminated_at = registry_.now();
    record_termination(terminated);
    return TeardownResult::COMPLETED;
}

size_t LifecycleSupervisor::shutdown_all() {
    size_t failures = 0;
    for (const Session& session : registry_.list_active()) {
        if (session.state == SessionState::PROVISIONING) {
            continue;
        }
        try {
            if (teardown(session.id, TerminationCause::SHUTDOWN) == TeardownResult::FAILED) {
                ++failures;
            }
        } catch (const NotFoundError&) {
            // Already gone
        }
    }

    if (failures > 0) {
        TL_LOG_ERROR(LOG_COMPONENT, failures << " worker(s) could not be stopped during shutdown");
    }
    return failures;
}

void LifecycleSupervisor::set_session_terminated_callback(SessionTerminatedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    session_terminated_callback_ = std::move(callback);
}

void LifecycleSupervisor::record_termination(const Session& session) {
    switch (session.cause) {
        case TerminationCause::EXPIRED:
            metrics_.counter(Metrics::SESSIONS_TERMINATED_EXPIRED)->increment();
            break;
        case TerminationCause::DELETED:
            metrics_.counter(Metrics::SESSIONS_TERMINATED_DELETED)->increment();
            break;
        case TerminationCause::CRASHED:
            metrics_.counter(Metrics::SESSIONS_TERMINATED_CRASHED)->increment();
            break;
        default:
            break;
    }
    update_active_gauge();

    TL_LOG_INFO(LOG_COMPONENT, "Session " << short_id(session.id) << " terminated ("
                << Utils::termination_cause_to_string(session.cause) << "), port "
                << session.port << " released");

    SessionTerminatedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = session_terminated_callback_;
    }
    if (callback) {
        try {
            callback(session);
        } catch (const std::exception& e) {
            TL_LOG_WARN(LOG_COMPONENT, "Session terminated callback failed: " << e.what());
        }
    }
}

void LifecycleSupervisor::update_active_gauge() {
    metrics_.gauge(Metrics::SESSIONS_ACTIVE)->set(static_cast<double>(registry_.active_count()));
}

} // namespace termlease
