// src/session.cpp
// Implementation of the session registry and admission tokens

#include "termlease/session.hpp"

namespace termlease {

//=============================================================================
// ADMISSION TOKEN IMPLEMENTATION
//=============================================================================

AdmissionToken::~AdmissionToken() {
    release();
}

AdmissionToken::AdmissionToken(AdmissionToken&& other) noexcept
    : registry_(other.registry_) {
    other.registry_ = nullptr;
}

AdmissionToken& AdmissionToken::operator=(AdmissionToken&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = other.registry_;
        other.registry_ = nullptr;
    }
    return *this;
}

void AdmissionToken::release() noexcept {
    if (registry_) {
        registry_->release_reservation();
        registry_ = nullptr;
    }
}

//=============================================================================
// SESSION REGISTRY IMPLEMENTATION
//=============================================================================

SessionRegistry::SessionRegistry(size_t capacity, std::chrono::seconds tombstone_retention, Clock clock)
    : capacity_(capacity)
    , tombstone_retention_(tombstone_retention)
    , clock_(clock ? std::move(clock) : Clock(Utils::now_milliseconds)) {
    if (capacity_ == 0) {
        throw Errors::invalid_capacity(capacity_);
    }
}

AdmissionToken SessionRegistry::try_admit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.size() + reserved_ >= capacity_) {
        throw Errors::capacity_exceeded(capacity_);
    }
    ++reserved_;
    return AdmissionToken(this);
}

void SessionRegistry::insert(AdmissionToken&& token, const Session& session) {
    if (token.registry_ != this) {
        throw Error(ErrorCode::UNKNOWN_ERROR, "Admission token does not belong to this registry");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (active_.count(session.id) || tombstones_.count(session.id)) {
        throw ValidationError(ErrorCode::INVALID_SESSION_ID, "session_id",
            "Duplicate session id", session.id);
    }

    Entry entry;
    entry.session = session;
    entry.session.state = SessionState::PROVISIONING;
    active_.emplace(session.id, std::move(entry));

    // The slot now belongs to the record
    --reserved_;
    token.registry_ = nullptr;
}

void SessionRegistry::mark_running(const SessionId& id, const WorkerRef& worker_ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
        throw Errors::session_not_found(id);
    }
    if (it->second.session.state != SessionState::PROVISIONING) {
        throw Errors::session_not_running(id);
    }
    it->second.session.state = SessionState::RUNNING;
    it->second.session.worker_ref = worker_ref;
}

Session SessionRegistry::get(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it != active_.end()) {
        return it->second.session;
    }
    auto tomb = tombstones_.find(id);
    if (tomb != tombstones_.end()) {
        return tomb->second;
    }
    throw Errors::session_not_found(id);
}

bool SessionRegistry::mark_expiring(const SessionId& id, TerminationCause cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end() || it->second.session.state != SessionState::RUNNING) {
        return false;
    }
    it->second.session.state = SessionState::EXPIRING;
    it->second.session.cause = cause;
    return true;
}

std::optional<Session> SessionRegistry::begin_teardown(const SessionId& id, TerminationCause cause) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
        if (tombstones_.count(id)) {
            return std::nullopt;
        }
        throw Errors::session_not_found(id);
    }

    Entry& entry = it->second;
    if (entry.teardown_claimed || entry.session.state == SessionState::PROVISIONING) {
        return std::nullopt;
    }

    if (entry.session.state == SessionState::RUNNING) {
        entry.session.state = SessionState::EXPIRING;
    }
    // A stranded EXPIRING session keeps the cause it was first given
    if (entry.session.cause == TerminationCause::NONE) {
        entry.session.cause = cause;
    }
    entry.teardown_claimed = true;
    return entry.session;
}

void SessionRegistry::abandon_teardown(const SessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it != active_.end()) {
        it->second.teardown_claimed = false;
        ++it->second.session.teardown_attempts;
    }
}

void SessionRegistry::remove(const SessionId& id, const ReleaseHook& on_removed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end()) {
        return;
    }

    Session session = std::move(it->second.session);
    active_.erase(it);

    session.state = SessionState::TERMINATED;
    session.terminated_at = clock_();
    Session& tombstone = tombstones_[session.id];
    tombstone = std::move(session);

    if (on_removed) {
        on_removed(tombstone);
    }
}

void SessionRegistry::abort_provisioning(const SessionId& id, const ReleaseHook& on_removed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it == active_.end() || it->second.session.state != SessionState::PROVISIONING) {
        return;
    }

    Session session = std::move(it->second.session);
    active_.erase(it);

    if (on_removed) {
        on_removed(session);
    }
}

std::vector<Session> SessionRegistry::list_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Session> sessions;
    sessions.reserve(active_.size());
    for (const auto& pair : active_) {
        sessions.push_back(pair.second.session);
    }
    return sessions;
}

size_t SessionRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size() + reserved_;
}

bool SessionRegistry::contains(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(id) > 0 || tombstones_.count(id) > 0;
}

bool SessionRegistry::teardown_in_progress(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    return it != active_.end() && it->second.teardown_claimed;
}

size_t SessionRegistry::tombstone_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tombstones_.size();
}

size_t SessionRegistry::purge_tombstones(Timestamp now) {
    auto retention_ms = static_cast<Timestamp>(tombstone_retention_.count()) * 1000;

    std::lock_guard<std::mutex> lock(mutex_);
    size_t purged = 0;
    for (auto it = tombstones_.begin(); it != tombstones_.end();) {
        if (now >= it->second.terminated_at + retention_ms) {
            it = tombstones_.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    return purged;
}

void SessionRegistry::release_reservation() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reserved_ > 0) {
        --reserved_;
    }
}

} // namespace termlease
