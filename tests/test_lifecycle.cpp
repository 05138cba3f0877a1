// tests/test_lifecycle.cpp
// Tests for the daemon lifecycle manager: task ordering, failure handling and signals

#include <gtest/gtest.h>
#include "termlease/lifecycle.hpp"
#include "termlease/logger.hpp"
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

using namespace termlease;
using State = LifecycleManager::ApplicationState;

class LifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(SystemLogLevel::NONE);
    }

    void TearDown() override {
        Logger::instance().set_level(SystemLogLevel::INFO);
    }

    LifecycleManager lifecycle;
    std::vector<std::string> order;
};

TEST_F(LifecycleTest, TestTasksRunByPriority) {
    lifecycle.register_startup_task("http", [&] { order.push_back("start:http"); }, 50);
    lifecycle.register_startup_task("orchestrator", [&] { order.push_back("start:orchestrator"); }, 100);
    lifecycle.register_shutdown_task("logger", [&] { order.push_back("stop:logger"); }, 0);
    lifecycle.register_shutdown_task("http", [&] { order.push_back("stop:http"); }, 100);
    lifecycle.register_shutdown_task("orchestrator", [&] { order.push_back("stop:orchestrator"); }, 50);

    lifecycle.start();
    EXPECT_TRUE(lifecycle.is_running());
    lifecycle.stop();
    EXPECT_TRUE(lifecycle.is_stopped());

    std::vector<std::string> expected = {
        "start:orchestrator", "start:http",
        "stop:http", "stop:orchestrator", "stop:logger"
    };
    EXPECT_EQ(order, expected);
}

TEST_F(LifecycleTest, TestEqualPrioritiesKeepRegistrationOrder) {
    lifecycle.register_startup_task("first", [&] { order.push_back("first"); });
    lifecycle.register_startup_task("second", [&] { order.push_back("second"); });
    lifecycle.start();

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "first");
    EXPECT_EQ(order[1], "second");
}

TEST_F(LifecycleTest, TestFailedStartupRunsShutdownTasks) {
    lifecycle.register_startup_task("bind", [] { throw std::runtime_error("address in use"); });
    lifecycle.register_shutdown_task("cleanup", [&] { order.push_back("cleanup"); });

    EXPECT_THROW(lifecycle.start(), std::runtime_error);
    EXPECT_EQ(lifecycle.get_state(), State::FAILED);
    ASSERT_EQ(order.size(), 1u);
    EXPECT_EQ(order[0], "cleanup");
}

TEST_F(LifecycleTest, TestFailingShutdownTaskDoesNotStopOthers) {
    lifecycle.register_shutdown_task("broken", [] { throw std::runtime_error("boom"); }, 10);
    lifecycle.register_shutdown_task("after", [&] { order.push_back("after"); }, 0);

    lifecycle.start();
    EXPECT_NO_THROW(lifecycle.stop());
    ASSERT_EQ(order.size(), 1u);
    EXPECT_EQ(order[0], "after");
}

TEST_F(LifecycleTest, TestStateCallbackAndMetrics) {
    std::vector<std::string> transitions;
    lifecycle.set_state_change_callback([&](State from, State to) {
        transitions.push_back(application_state_to_string(from) + "->" + application_state_to_string(to));
    });

    lifecycle.start();
    LifecycleManager::LifecycleMetrics running = lifecycle.get_metrics();
    EXPECT_GT(running.startup_time, 0u);
    EXPECT_EQ(running.current_state, State::RUNNING);

    lifecycle.stop();
    LifecycleManager::LifecycleMetrics stopped = lifecycle.get_metrics();
    EXPECT_GE(stopped.shutdown_time, stopped.startup_time);

    std::vector<std::string> expected = {
        "stopped->starting", "starting->running", "running->stopping", "stopping->stopped"
    };
    EXPECT_EQ(transitions, expected);
}

TEST_F(LifecycleTest, TestUptimeVisibleWhileStopping) {
    std::chrono::milliseconds uptime_at_stop{-1};
    lifecycle.set_state_change_callback([&](State, State to) {
        if (to == State::STOPPING) {
            uptime_at_stop = lifecycle.get_metrics().uptime;
        }
    });

    lifecycle.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    lifecycle.stop();

    EXPECT_GE(uptime_at_stop, std::chrono::milliseconds(20));
    EXPECT_GE(lifecycle.get_metrics().uptime, uptime_at_stop);
}

TEST_F(LifecycleTest, TestStartAndStopAreIdempotent) {
    int starts = 0;
    int stops = 0;
    lifecycle.register_startup_task("count", [&] { ++starts; });
    lifecycle.register_shutdown_task("count", [&] { ++stops; });

    lifecycle.start();
    lifecycle.start();
    lifecycle.stop();
    lifecycle.stop();

    EXPECT_EQ(starts, 1);
    EXPECT_EQ(stops, 1);
}

TEST_F(LifecycleTest, TestWaitsForShutdownSignal) {
    LifecycleManager::block_shutdown_signals();

    // Directed at this thread, so it stays pending until sigwait collects it
    ASSERT_EQ(pthread_kill(pthread_self(), SIGTERM), 0);
    EXPECT_EQ(LifecycleManager::wait_for_shutdown_signal(), SIGTERM);

    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_UNBLOCK, &set, nullptr);
}
