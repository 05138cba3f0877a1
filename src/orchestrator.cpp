// src/orchestrator.cpp
// Implementation of the orchestrator facade

#include "termlease/orchestrator.hpp"
#include "termlease/logger.hpp"
#include "termlease/utils.hpp"
#include <algorithm>

namespace termlease {

namespace {
constexpr const char* LOG_COMPONENT = "orchestrator";

// Comparison time depends only on the lengths
bool secrets_equal(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

const Config& validated(const Config& config) {
    config.validate();
    return config;
}

WorkerDriver& require_driver(const std::shared_ptr<WorkerDriver>& driver) {
    if (!driver) {
        throw ConfigError(ErrorCode::INVALID_CONFIG, "worker_driver", "A worker driver is required");
    }
    return *driver;
}
}

Orchestrator::Orchestrator(const Config& config,
                           std::shared_ptr<WorkerDriver> driver,
                           std::shared_ptr<LeadStore> leads,
                           Clock clock)
    : config_(validated(config))
    , clock_(clock ? std::move(clock) : Clock(Utils::now_milliseconds))
    , driver_(std::move(driver))
    , leads_(leads ? std::move(leads) : std::make_shared<MemoryLeadStore>())
    , registry_(config_.session().max_concurrent_sessions, config_.session().tombstone_retention, clock_)
    , ports_(config_.ports().base_port, config_.session().max_concurrent_sessions)
    , supervisor_(registry_, ports_, require_driver(driver_), metrics_, config_.session().sweep_interval) {
    metrics_.counter(Metrics::SESSIONS_CREATED);
    metrics_.counter(Metrics::SESSIONS_REJECTED_CAPACITY);
    metrics_.counter(Metrics::SESSIONS_START_FAILURES);
    metrics_.histogram(Metrics::WORKER_START_LATENCY_MS);
}

Orchestrator::~Orchestrator() {
    stop();
}

void Orchestrator::start() {
    if (running_.exchange(true)) {
        return;
    }
    stopped_ = false;
    supervisor_.start();
    TL_LOG_INFO(LOG_COMPONENT, "Orchestrator started: " << config_.session().max_concurrent_sessions
                << " slots, ports " << config_.ports().base_port << "-"
                << (config_.ports().base_port + config_.session().max_concurrent_sessions - 1)
                << ", sessions last " << config_.session().duration.count() << "s");
}

void Orchestrator::stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    running_ = false;
    supervisor_.stop();

    size_t active = registry_.active_count();
    if (active > 0) {
        TL_LOG_INFO(LOG_COMPONENT, "Tearing down " << active << " active session(s)");
    }
    supervisor_.shutdown_all();
}

SessionGrant Orchestrator::create_session(const std::string& email, const std::string& client_address) {
    std::string normalized = validate_email(email);

    if (stopped_) {
        throw Error(ErrorCode::ORCHESTRATOR_STOPPED, "Orchestrator is shutting down");
    }

    // Overdue sessions must not hold slots until the next sweep
    supervisor_.expire_due();

    AdmissionToken token;
    try {
        token = registry_.try_admit();
    } catch (const CapacityError&) {
        metrics_.counter(Metrics::SESSIONS_REJECTED_CAPACITY)->increment();
        TL_LOG_INFO(LOG_COMPONENT, "Rejected session request: all "
                    << registry_.capacity() << " slots in use");
        throw;
    }

    Session session;
    session.id = unique_session_id();
    session.email = normalized;
    session.created_at = clock_();
    session.expires_at = session.created_at +
        static_cast<Timestamp>(config_.session().duration.count()) * 1000;

    // Leads are kept even if the session later fails to start
    leads_->append(Lead{normalized, session.id, session.created_at, client_address});

    try {
        session.port = ports_.acquire();
    } catch (const CapacityError& e) {
        // The slot was granted, so a free port must exist
        metrics_.counter(Metrics::SESSIONS_REJECTED_CAPACITY)->increment();
        TL_LOG_ERROR(LOG_COMPONENT, "Invariant violation: admitted session without a free port: " << e.what());
        throw Errors::capacity_exceeded(registry_.capacity());
    }

    try {
        registry_.insert(std::move(token), session);
    } catch (const Error&) {
        ports_.release(session.port);
        throw;
    }

    // Port and slot are freed together, so an admitted request always finds a free port
    auto rollback = [this, &session]() {
        bool released = false;
        registry_.abort_provisioning(session.id, [this, &released](const Session& aborted) {
            ports_.release(aborted.port);
            released = true;
        });
        if (!released) {
            // No record left to hold the port
            ports_.release(session.port);
        }
        metrics_.counter(Metrics::SESSIONS_START_FAILURES)->increment();
    };

    WorkerSpec spec;
    spec.session_id = session.id;
    spec.port = session.port;
    spec.image = config_.worker().image;

    try {
        ServerTimer timer(metrics_.histogram(Metrics::WORKER_START_LATENCY_MS));
        session.worker_ref = driver_->start(spec);
    } catch (const Error& e) {
        rollback();
        TL_LOG_ERROR(LOG_COMPONENT, "Failed to start worker for session " << session.id.substr(0, 8)
                     << ": " << e.what());
        throw;
    } catch (const std::exception& e) {
        rollback();
        TL_LOG_ERROR(LOG_COMPONENT, "Failed to start worker for session " << session.id.substr(0, 8)
                     << ": " << e.what());
        throw Errors::start_failure(session.id, e.what());
    }

    try {
        registry_.mark_running(session.id, session.worker_ref);
    } catch (const Error& e) {
        try {
            driver_->stop(session.worker_ref);
        } catch (const Error& stop_error) {
            TL_LOG_ERROR(LOG_COMPONENT, "Orphaned worker " << session.worker_ref.substr(0, 12)
                         << ": " << stop_error.what());
        }
        rollback();
        throw Errors::start_failure(session.id, e.what());
    }
    session.state = SessionState::RUNNING;

    metrics_.counter(Metrics::SESSIONS_CREATED)->increment();
    metrics_.gauge(Metrics::SESSIONS_ACTIVE)->set(static_cast<double>(registry_.active_count()));
    TL_LOG_INFO(LOG_COMPONENT, "Session " << session.id.substr(0, 8) << " started on port "
                << session.port << " for " << normalized);

    notify_created(session);

    SessionGrant grant;
    grant.session_id = session.id;
    grant.state = SessionState::RUNNING;
    grant.host = config_.ports().public_host;
    grant.port = session.port;
    grant.terminal_path = "/terminal/" + session.id;
    grant.expires_at = session.expires_at;
    grant.duration = config_.session().duration;
    return grant;
}

SessionStatus Orchestrator::get_session(const SessionId& id) const {
    Session session = registry_.get(id);
    Timestamp now = clock_();

    SessionStatus status;
    status.session_id = session.id;
    status.state = session.state;
    status.active = session.state == SessionState::RUNNING && now < session.expires_at;
    status.remaining_seconds = session.remaining_seconds(now);
    status.port = session.port;
    status.expires_at = session.expires_at;
    status.cause = session.cause;
    return status;
}

void Orchestrator::delete_session(const SessionId& id) {
    Session session = registry_.get(id);

    switch (session.state) {
        case SessionState::TERMINATED:
            return;
        case SessionState::PROVISIONING:
            // The id has not been handed out yet
            throw Errors::session_not_found(id);
        default:
            break;
    }

    registry_.mark_expiring(id, TerminationCause::DELETED);

    TeardownResult result = supervisor_.teardown(id, TerminationCause::DELETED);
    if (result == TeardownResult::FAILED) {
        TL_LOG_WARN(LOG_COMPONENT, "Inline teardown of session " << id.substr(0, 8)
                    << " failed; the sweep will retry");
    }
}

std::vector<Lead> Orchestrator::export_leads(const std::string& credential) const {
    const std::string& secret = config_.server().admin_secret;
    if (secret.empty() || credential.empty() || !secrets_equal(secret, credential)) {
        TL_LOG_WARN(LOG_COMPONENT, "Rejected lead export with invalid credential");
        throw Errors::unauthorized();
    }
    return leads_->all();
}

HealthReport Orchestrator::health() const {
    HealthReport report;
    report.active_sessions = registry_.active_count();
    report.max_sessions = registry_.capacity();
    report.available_ports = ports_.available_count();
    report.last_sweep_at = supervisor_.last_sweep_at();
    report.metrics = metrics_.export_values();
    report.details["supervisor"] = supervisor_.is_running() ? "running" : "stopped";
    report.details["leads"] = std::to_string(leads_->count());

    std::vector<std::string> issues;
    if (stopped_) {
        report.status = HealthStatus::UNHEALTHY;
        issues.push_back("orchestrator stopped");
    }
    if (report.active_sessions >= report.max_sessions) {
        issues.push_back("at capacity");
    }
    auto stall_threshold = static_cast<Timestamp>(supervisor_.sweep_interval().count()) * 3;
    if (supervisor_.is_running() && report.last_sweep_at > 0 &&
        report.timestamp > report.last_sweep_at + stall_threshold) {
        issues.push_back("sweep stalled");
    }

    if (!issues.empty() && report.status == HealthStatus::HEALTHY) {
        report.status = HealthStatus::DEGRADED;
    }

    if (issues.empty()) {
        report.message = "All systems operational";
    } else {
        report.message = "Issues detected: ";
        for (size_t i = 0; i < issues.size(); ++i) {
            if (i > 0) report.message += "; ";
            report.message += issues[i];
        }
    }
    return report;
}

std::string Orchestrator::terminal_target(const SessionId& id) {
    Session session = registry_.get(id);
    if (session.state == SessionState::RUNNING && clock_() >= session.expires_at) {
        supervisor_.teardown(id, TerminationCause::EXPIRED);
        throw Errors::session_not_running(id);
    }
    if (session.state != SessionState::RUNNING) {
        throw Errors::session_not_running(id);
    }
    return config_.server().terminal_proxy_prefix + std::to_string(session.port) + "/";
}

void Orchestrator::set_session_created_callback(SessionCreatedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    session_created_callback_ = std::move(callback);
}

void Orchestrator::set_session_terminated_callback(SessionTerminatedCallback callback) {
    supervisor_.set_session_terminated_callback(std::move(callback));
}

std::string Orchestrator::validate_email(const std::string& email) const {
    std::string normalized = Utils::normalize_email(email);
    if (normalized.empty()) {
        throw Errors::empty_email();
    }
    if (!Utils::is_valid_email(normalized)) {
        throw Errors::invalid_email(normalized);
    }

    if (config_.leads().require_company_email) {
        std::string domain = Utils::email_domain(normalized);
        const auto& blocked = config_.leads().blocked_email_domains;
        if (std::find(blocked.begin(), blocked.end(), domain) != blocked.end()) {
            throw Errors::blocked_email_domain(domain);
        }
    }
    return normalized;
}

SessionId Orchestrator::unique_session_id() const {
    SessionId id = Utils::generate_session_id();
    while (registry_.contains(id)) {
        id = Utils::generate_session_id();
    }
    return id;
}

void Orchestrator::notify_created(const Session& session) {
    SessionCreatedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = session_created_callback_;
    }
    if (callback) {
        try {
            callback(session);
        } catch (const std::exception& e) {
            TL_LOG_WARN(LOG_COMPONENT, "Session created callback failed: " << e.what());
        }
    }
}

} // namespace termlease
