// include/termlease/session.hpp
// Purpose: Session registry - the single owner of session records
// Admission control, state transitions and the teardown claim, all behind one mutex

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>
#include <mutex>
#include <chrono>
#include <optional>

namespace termlease {

class SessionRegistry;

//=============================================================================
// ADMISSION TOKEN - a reserved capacity slot
//=============================================================================

// Move-only. A live token counts toward capacity; destroying it without
// handing it to SessionRegistry::insert returns the slot.
class AdmissionToken {
public:
    AdmissionToken() = default;
    ~AdmissionToken();

    AdmissionToken(AdmissionToken&& other) noexcept;
    AdmissionToken& operator=(AdmissionToken&& other) noexcept;
    AdmissionToken(const AdmissionToken&) = delete;
    AdmissionToken& operator=(const AdmissionToken&) = delete;

    bool valid() const noexcept { return registry_ != nullptr; }

    // Return the slot early
    void release() noexcept;

private:
    friend class SessionRegistry;
    explicit AdmissionToken(SessionRegistry* registry) : registry_(registry) {}

    SessionRegistry* registry_ = nullptr;
};

//=============================================================================
// SESSION REGISTRY
//=============================================================================

class SessionRegistry {
public:
    SessionRegistry(size_t capacity,
                    std::chrono::seconds tombstone_retention = std::chrono::seconds(Defaults::TOMBSTONE_RETENTION_SECONDS),
                    Clock clock = Utils::now_milliseconds);
    ~SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Reserve a slot; throws CapacityError(CAPACITY_EXCEEDED) when
    // active records plus outstanding tokens reach capacity
    AdmissionToken try_admit();

    // Consume the token and store the record in the PROVISIONING state
    void insert(AdmissionToken&& token, const Session& session);

    // PROVISIONING -> RUNNING
    void mark_running(const SessionId& id, const WorkerRef& worker_ref);

    // Copy of the record (active or tombstoned); throws NotFoundError
    Session get(const SessionId& id) const;

    // RUNNING -> EXPIRING with a cause; false if the session was not running
    bool mark_expiring(const SessionId& id, TerminationCause cause);

    // Grant exclusive teardown ownership. Moves RUNNING to EXPIRING.
    // Returns nullopt when another caller owns the teardown, the session is
    // already terminated, or it is still provisioning. Throws NotFoundError
    // for unknown ids.
    std::optional<Session> begin_teardown(const SessionId& id, TerminationCause cause);

    // Give up ownership after a failed teardown so the sweep can retry
    void abandon_teardown(const SessionId& id);

    // Runs under the registry lock once a record has left the active set
    using ReleaseHook = std::function<void(const Session&)>;

    // Complete teardown: EXPIRING -> TERMINATED, frees the capacity slot and
    // keeps the record as a tombstone. No-op for unknown or terminated ids.
    // `on_removed` sees the tombstone before any admission can observe the freed slot.
    void remove(const SessionId& id, const ReleaseHook& on_removed = nullptr);

    // Drop a PROVISIONING record whose worker never started. No tombstone.
    void abort_provisioning(const SessionId& id, const ReleaseHook& on_removed = nullptr);

    // Copies of every non-terminated record
    std::vector<Session> list_active() const;

    size_t active_count() const;
    size_t capacity() const noexcept { return capacity_; }
    bool contains(const SessionId& id) const;
    bool teardown_in_progress(const SessionId& id) const;
    size_t tombstone_count() const;

    // Remove tombstones older than the retention window; returns the number purged
    size_t purge_tombstones(Timestamp now);

    Timestamp now() const { return clock_(); }

private:
    friend class AdmissionToken;

    struct Entry {
        Session session;
        bool teardown_claimed = false;
    };

    size_t capacity_;
    std::chrono::seconds tombstone_retention_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<SessionId, Entry> active_;
    std::unordered_map<SessionId, Session> tombstones_;
    size_t reserved_ = 0;

    void release_reservation() noexcept;
};

} // namespace termlease
