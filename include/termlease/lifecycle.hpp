// include/termlease/lifecycle.hpp
// Purpose: Process lifecycle for the termleased daemon
// Prioritized startup and shutdown tasks plus SIGINT/SIGTERM handling

#pragma once

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace termlease {

class LifecycleManager {
public:
    enum class ApplicationState {
        STARTING = 0,
        RUNNING = 1,
        STOPPING = 2,
        STOPPED = 3,
        FAILED = 4
    };

    LifecycleManager() = default;
    ~LifecycleManager();

    // Runs startup tasks, highest priority first. If one throws, the state
    // becomes FAILED, shutdown tasks run, and the exception propagates.
    void start();

    // Runs shutdown tasks, highest priority first; a failing task is logged
    // and the rest still run
    void stop();

    ApplicationState get_state() const { return state_.load(); }
    bool is_running() const { return get_state() == ApplicationState::RUNNING; }
    bool is_stopped() const { return get_state() == ApplicationState::STOPPED; }

    using StartupTask = std::function<void()>;
    using ShutdownTask = std::function<void()>;

    void register_startup_task(const std::string& name, StartupTask task, int priority = 0);
    void register_shutdown_task(const std::string& name, ShutdownTask task, int priority = 0);

    // Blocks SIGINT/SIGTERM in the calling thread; call before spawning threads
    static void block_shutdown_signals();

    // Waits for SIGINT or SIGTERM and returns the signal number
    static int wait_for_shutdown_signal();

    struct LifecycleMetrics {
        Timestamp startup_time = 0;
        Timestamp shutdown_time = 0;
        std::chrono::milliseconds uptime{0};
        ApplicationState current_state = ApplicationState::STOPPED;
    };

    LifecycleMetrics get_metrics() const;

    using StateChangeCallback = std::function<void(ApplicationState old_state, ApplicationState new_state)>;
    void set_state_change_callback(StateChangeCallback callback);

private:
    std::atomic<ApplicationState> state_{ApplicationState::STOPPED};

    struct Task {
        std::string name;
        std::function<void()> function;
        int priority;

        bool operator<(const Task& other) const {
            return priority > other.priority; // Higher priority first
        }
    };

    std::vector<Task> startup_tasks_;
    std::vector<Task> shutdown_tasks_;
    mutable std::mutex tasks_mutex_;

    std::atomic<Timestamp> startup_time_{0};
    std::atomic<Timestamp> shutdown_time_{0};

    StateChangeCallback state_change_callback_;

    void set_state(ApplicationState new_state);
    void execute_shutdown_tasks();
};

std::string application_state_to_string(LifecycleManager::ApplicationState state);

} // namespace termlease
