// tests/test_supervisor.cpp
// Tests for the lifecycle supervisor: expiry, crash detection, teardown retries and shutdown

#include <gtest/gtest.h>
#include "termlease/supervisor.hpp"
#include "termlease/logger.hpp"
#include "fake_worker_driver.hpp"
#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace termlease;
using termlease::testing::FakeWorkerDriver;
using termlease::testing::ManualClock;

class SupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(SystemLogLevel::ERROR);
        registry = std::make_unique<SessionRegistry>(3, std::chrono::seconds(60), clock.clock());
        ports = std::make_unique<PortAllocator>(7700, 3);
        supervisor = std::make_unique<LifecycleSupervisor>(
            *registry, *ports, driver, metrics, std::chrono::milliseconds(100));
    }

    void TearDown() override {
        supervisor.reset();
        ports.reset();
        registry.reset();
        Logger::instance().set_level(SystemLogLevel::INFO);
    }

    // Admit, allocate and start a session the way the orchestrator does
    Session add_session(const SessionId& id, std::chrono::seconds lifetime = std::chrono::seconds(60)) {
        Session session;
        session.id = id;
        session.email = "jane@acme.io";
        session.created_at = clock.now();
        session.expires_at = clock.now() + static_cast<Timestamp>(lifetime.count()) * 1000;
        session.port = ports->acquire();
        registry->insert(registry->try_admit(), session);

        WorkerSpec spec;
        spec.session_id = id;
        spec.port = session.port;
        WorkerRef ref = driver.start(spec);
        registry->mark_running(id, ref);
        return registry->get(id);
    }

    ManualClock clock;
    FakeWorkerDriver driver;
    MetricsRegistry metrics;
    std::unique_ptr<SessionRegistry> registry;
    std::unique_ptr<PortAllocator> ports;
    std::unique_ptr<LifecycleSupervisor> supervisor;
};

// Tests for expiry
TEST_F(SupervisorTest, TestSweepExpiresSession) {
    Session session = add_session("session-a");

    SweepStats first = supervisor->sweep_once();
    EXPECT_EQ(first.examined, 1u);
    EXPECT_EQ(first.expired, 0u);
    EXPECT_EQ(registry->get("session-a").state, SessionState::RUNNING);

    clock.advance(std::chrono::seconds(60));
    SweepStats second = supervisor->sweep_once();
    EXPECT_EQ(second.expired, 1u);

    Session terminated = registry->get("session-a");
    EXPECT_EQ(terminated.state, SessionState::TERMINATED);
    EXPECT_EQ(terminated.cause, TerminationCause::EXPIRED);
    EXPECT_FALSE(ports->is_allocated(session.port));
    EXPECT_EQ(registry->active_count(), 0u);
    EXPECT_EQ(driver.successful_stops(session.worker_ref), 1);
    EXPECT_EQ(metrics.value(Metrics::SESSIONS_TERMINATED_EXPIRED), 1.0);
    EXPECT_EQ(metrics.value(Metrics::SESSIONS_ACTIVE), 0.0);
}

TEST_F(SupervisorTest, TestExpiredSessionFreesPortForNextSession) {
    add_session("a");
    add_session("b");
    add_session("c");
    EXPECT_THROW(registry->try_admit(), CapacityError);

    clock.advance(std::chrono::seconds(61));
    supervisor->sweep_once();

    EXPECT_EQ(ports->available_count(), 3u);
    Session next = add_session("d");
    EXPECT_EQ(next.port, 7700);
}

TEST_F(SupervisorTest, TestExpireDueSkipsLiveSessions) {
    add_session("short", std::chrono::seconds(10));
    add_session("long", std::chrono::seconds(60));

    EXPECT_EQ(supervisor->expire_due(), 0u);

    clock.advance(std::chrono::seconds(10));
    EXPECT_EQ(supervisor->expire_due(), 1u);
    EXPECT_EQ(registry->get("short").state, SessionState::TERMINATED);
    EXPECT_EQ(registry->get("short").cause, TerminationCause::EXPIRED);
    EXPECT_EQ(registry->get("long").state, SessionState::RUNNING);
    EXPECT_EQ(ports->allocated_count(), 1u);

    // Already terminated sessions are not counted twice
    EXPECT_EQ(supervisor->expire_due(), 0u);
}

TEST_F(SupervisorTest, TestTeardownFreesPortOnlyAfterRecordLeaves) {
    Session session = add_session("session-a");

    // While teardown holds the registry, a concurrent creator must not get the port
    std::atomic<bool> port_seen_free{false};
    std::atomic<bool> record_gone{false};
    std::thread observer([&] {
        while (!record_gone) {
            if (!ports->is_allocated(session.port)) {
                port_seen_free = true;
                if (registry->active_count() != 0) {
                    ADD_FAILURE() << "port released while its session was still active";
                }
                return;
            }
            std::this_thread::yield();
        }
    });

    EXPECT_EQ(supervisor->teardown("session-a", TerminationCause::DELETED), TeardownResult::COMPLETED);
    record_gone = true;
    observer.join();

    EXPECT_FALSE(ports->is_allocated(session.port));
    EXPECT_EQ(registry->active_count(), 0u);
}

// Tests for liveness
TEST_F(SupervisorTest, TestSweepDetectsCrashedWorker) {
    Session session = add_session("session-a");
    driver.kill(session.worker_ref);

    SweepStats stats = supervisor->sweep_once();
    EXPECT_EQ(stats.crashed, 1u);

    Session terminated = registry->get("session-a");
    EXPECT_EQ(terminated.state, SessionState::TERMINATED);
    EXPECT_EQ(terminated.cause, TerminationCause::CRASHED);
    EXPECT_FALSE(ports->is_allocated(session.port));
    EXPECT_EQ(metrics.value(Metrics::SESSIONS_TERMINATED_CRASHED), 1.0);
}

TEST_F(SupervisorTest, TestDeleteDuringProbeIsNotCountedAsCrash) {
    Session session = add_session("session-a");
    driver.set_probe_hook([this](const WorkerRef&) {
        supervisor->teardown("session-a", TerminationCause::DELETED);
    });

    SweepStats stats = supervisor->sweep_once();
    driver.set_probe_hook(nullptr);

    EXPECT_EQ(stats.crashed, 0u);
    EXPECT_EQ(stats.failures, 0u);
    Session terminated = registry->get("session-a");
    EXPECT_EQ(terminated.cause, TerminationCause::DELETED);
    EXPECT_EQ(driver.successful_stops(session.worker_ref), 1);
    EXPECT_EQ(metrics.value(Metrics::SESSIONS_TERMINATED_CRASHED), 0.0);
    EXPECT_EQ(metrics.value(Metrics::SESSIONS_TERMINATED_DELETED), 1.0);
}

TEST_F(SupervisorTest, TestInconclusiveProbeKeepsSession) {
    Session session = add_session("session-a");
    driver.fail_next_probes(1);

    SweepStats stats = supervisor->sweep_once();
    EXPECT_EQ(stats.crashed, 0u);
    EXPECT_EQ(stats.failures, 0u);
    EXPECT_EQ(registry->get("session-a").state, SessionState::RUNNING);
    EXPECT_EQ(driver.stop_calls(), 0);

    // The next probe answers normally
    supervisor->sweep_once();
    EXPECT_EQ(registry->get("session-a").state, SessionState::RUNNING);
}

TEST_F(SupervisorTest, TestProvisioningSessionsAreSkipped) {
    Session session;
    session.id = "provisioning";
    session.expires_at = clock.now();
    session.port = ports->acquire();
    registry->insert(registry->try_admit(), session);

    clock.advance(std::chrono::seconds(120));
    SweepStats stats = supervisor->sweep_once();
    EXPECT_EQ(stats.expired, 0u);
    EXPECT_EQ(registry->get("provisioning").state, SessionState::PROVISIONING);
    EXPECT_TRUE(ports->is_allocated(session.port));
}

// Tests for teardown
TEST_F(SupervisorTest, TestTeardownIsIdempotent) {
    Session session = add_session("session-a");

    EXPECT_EQ(supervisor->teardown("session-a", TerminationCause::DELETED), TeardownResult::COMPLETED);
    EXPECT_EQ(supervisor->teardown("session-a", TerminationCause::DELETED), TeardownResult::NOT_OWNER);
    EXPECT_EQ(driver.stop_calls(), 1);
    EXPECT_EQ(registry->get("session-a").cause, TerminationCause::DELETED);

    EXPECT_THROW(supervisor->teardown("unknown", TerminationCause::DELETED), NotFoundError);
}

TEST_F(SupervisorTest, TestConcurrentTeardownStopsWorkerOnce) {
    Session session = add_session("session-a");
    driver.set_stop_delay(std::chrono::milliseconds(20));

    std::atomic<int> completed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            if (supervisor->teardown("session-a", TerminationCause::DELETED) == TeardownResult::COMPLETED) {
                completed.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(completed.load(), 1);
    EXPECT_EQ(driver.stop_calls(), 1);
    EXPECT_FALSE(ports->is_allocated(session.port));
}

TEST_F(SupervisorTest, TestFailedTeardownIsRetried) {
    Session session = add_session("session-a");
    driver.fail_next_stops(1);
    clock.advance(std::chrono::seconds(60));

    SweepStats first = supervisor->sweep_once();
    EXPECT_EQ(first.expired, 1u);
    EXPECT_EQ(first.failures, 1u);

    // Slot and port stay held while the worker may still be running
    Session stranded = registry->get("session-a");
    EXPECT_EQ(stranded.state, SessionState::EXPIRING);
    EXPECT_EQ(stranded.teardown_attempts, 1u);
    EXPECT_TRUE(ports->is_allocated(session.port));
    EXPECT_EQ(registry->active_count(), 1u);
    EXPECT_EQ(metrics.value(Metrics::TEARDOWN_FAILURES), 1.0);

    SweepStats second = supervisor->sweep_once();
    EXPECT_EQ(second.retried, 1u);
    EXPECT_EQ(second.failures, 0u);
    EXPECT_EQ(registry->get("session-a").state, SessionState::TERMINATED);
    EXPECT_FALSE(ports->is_allocated(session.port));
}

TEST_F(SupervisorTest, TestShutdownAll) {
    Session a = add_session("a");
    Session b = add_session("b");
    driver.fail_next_stops(1);

    EXPECT_EQ(supervisor->shutdown_all(), 1u);
    EXPECT_EQ(registry->active_count(), 1u);

    EXPECT_EQ(supervisor->shutdown_all(), 0u);
    EXPECT_EQ(registry->active_count(), 0u);
    EXPECT_EQ(registry->get("a").cause, TerminationCause::SHUTDOWN);
    EXPECT_EQ(registry->get("b").cause, TerminationCause::SHUTDOWN);
    EXPECT_EQ(driver.alive_count(), 0u);
    EXPECT_EQ(ports->allocated_count(), 0u);
}

TEST_F(SupervisorTest, TestTerminatedCallback) {
    std::vector<Session> terminated;
    supervisor->set_session_terminated_callback([&](const Session& session) {
        terminated.push_back(session);
    });

    add_session("session-a");
    supervisor->teardown("session-a", TerminationCause::DELETED);

    ASSERT_EQ(terminated.size(), 1u);
    EXPECT_EQ(terminated[0].id, "session-a");
    EXPECT_EQ(terminated[0].state, SessionState::TERMINATED);
    EXPECT_EQ(terminated[0].cause, TerminationCause::DELETED);
}

TEST_F(SupervisorTest, TestThrowingCallbackDoesNotBreakTeardown) {
    supervisor->set_session_terminated_callback([](const Session&) {
        throw std::runtime_error("notification failed");
    });

    Session session = add_session("session-a");
    EXPECT_EQ(supervisor->teardown("session-a", TerminationCause::DELETED), TeardownResult::COMPLETED);
    EXPECT_FALSE(ports->is_allocated(session.port));
}

TEST_F(SupervisorTest, TestSweepPurgesTombstones) {
    add_session("session-a");
    supervisor->teardown("session-a", TerminationCause::DELETED);
    EXPECT_EQ(registry->tombstone_count(), 1u);

    clock.advance(std::chrono::seconds(61));
    SweepStats stats = supervisor->sweep_once();
    EXPECT_EQ(stats.purged, 1u);
    EXPECT_THROW(registry->get("session-a"), NotFoundError);
}

TEST_F(SupervisorTest, TestSweepUpdatesMetrics) {
    EXPECT_EQ(supervisor->last_sweep_at(), 0u);
    supervisor->sweep_once();
    supervisor->sweep_once();

    EXPECT_GT(supervisor->last_sweep_at(), 0u);
    EXPECT_EQ(metrics.value(Metrics::SWEEPS_TOTAL), 2.0);
    EXPECT_EQ(metrics.get(Metrics::SWEEP_DURATION_MS)->get_count(), 2u);
}

// Tests for the background thread
TEST_F(SupervisorTest, TestBackgroundSweepExpiresSessions) {
    Session session = add_session("session-a", std::chrono::seconds(10));

    supervisor->start();
    EXPECT_TRUE(supervisor->is_running());
    clock.advance(std::chrono::seconds(11));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (registry->get("session-a").state != SessionState::TERMINATED &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    supervisor->stop();
    EXPECT_FALSE(supervisor->is_running());
    EXPECT_EQ(registry->get("session-a").state, SessionState::TERMINATED);
    EXPECT_FALSE(ports->is_allocated(session.port));
}

TEST_F(SupervisorTest, TestStopIsPromptAndRepeatable) {
    supervisor->start();
    supervisor->start();

    auto started = std::chrono::steady_clock::now();
    supervisor->stop();
    supervisor->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
}
