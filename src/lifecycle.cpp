// src/lifecycle.cpp
// Implementation of the daemon lifecycle manager

#include "termlease/lifecycle.hpp"
#include "termlease/errors.hpp"
#include "termlease/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <pthread.h>

namespace termlease {

namespace {
constexpr const char* LOG_COMPONENT = "lifecycle";

sigset_t shutdown_signal_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}
}

LifecycleManager::~LifecycleManager() {
    if (is_running()) {
        stop();
    }
}

void LifecycleManager::start() {
    if (get_state() == ApplicationState::RUNNING || get_state() == ApplicationState::STARTING) {
        return;
    }

    shutdown_time_ = 0;
    set_state(ApplicationState::STARTING);

    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks = startup_tasks_;
    }
    std::stable_sort(tasks.begin(), tasks.end());

    for (const auto& task : tasks) {
        try {
            TL_LOG_DEBUG(LOG_COMPONENT, "Startup: " << task.name);
            task.function();
        } catch (const std::exception& e) {
            TL_LOG_ERROR(LOG_COMPONENT, "Startup task '" << task.name << "' failed: " << e.what());
            set_state(ApplicationState::FAILED);
            execute_shutdown_tasks();
            throw;
        }
    }

    startup_time_ = Utils::now_milliseconds();
    set_state(ApplicationState::RUNNING);
}

void LifecycleManager::stop() {
    ApplicationState current = get_state();
    if (current == ApplicationState::STOPPED || current == ApplicationState::STOPPING) {
        return;
    }

    set_state(ApplicationState::STOPPING);
    execute_shutdown_tasks();
    shutdown_time_ = Utils::now_milliseconds();
    set_state(ApplicationState::STOPPED);
}

void LifecycleManager::register_startup_task(const std::string& name, StartupTask task, int priority) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    startup_tasks_.push_back({name, std::move(task), priority});
}

void LifecycleManager::register_shutdown_task(const std::string& name, ShutdownTask task, int priority) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    shutdown_tasks_.push_back({name, std::move(task), priority});
}

void LifecycleManager::block_shutdown_signals() {
    sigset_t set = shutdown_signal_set();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw SystemError(ErrorCode::SYSTEM_ERROR, "pthread_sigmask failed",
            std::error_code(rc, std::generic_category()));
    }
}

int LifecycleManager::wait_for_shutdown_signal() {
    sigset_t set = shutdown_signal_set();
    int signal_number = 0;
    int rc;
    do {
        rc = sigwait(&set, &signal_number);
    } while (rc == EINTR);

    if (rc != 0) {
        throw SystemError(ErrorCode::SYSTEM_ERROR, "sigwait failed",
            std::error_code(rc, std::generic_category()));
    }
    return signal_number;
}

LifecycleManager::LifecycleMetrics LifecycleManager::get_metrics() const {
    LifecycleMetrics metrics;
    metrics.startup_time = startup_time_;
    metrics.shutdown_time = shutdown_time_;
    metrics.current_state = get_state();
    if (metrics.startup_time > 0) {
        // Still counting until shutdown completes
        Timestamp end = metrics.shutdown_time > 0 ? metrics.shutdown_time : Utils::now_milliseconds();
        if (end > metrics.startup_time) {
            metrics.uptime = std::chrono::milliseconds(end - metrics.startup_time);
        }
    }
    return metrics;
}

void LifecycleManager::set_state_change_callback(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    state_change_callback_ = std::move(callback);
}

void LifecycleManager::set_state(ApplicationState new_state) {
    ApplicationState old_state = state_.exchange(new_state);

    StateChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        callback = state_change_callback_;
    }
    if (callback && old_state != new_state) {
        callback(old_state, new_state);
    }
}

void LifecycleManager::execute_shutdown_tasks() {
    std::vector<Task> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks = shutdown_tasks_;
    }
    std::stable_sort(tasks.begin(), tasks.end());

    for (const auto& task : tasks) {
        try {
            TL_LOG_DEBUG(LOG_COMPONENT, "Shutdown: " << task.name);
            task.function();
        } catch (const std::exception& e) {
            TL_LOG_ERROR(LOG_COMPONENT, "Shutdown task '" << task.name << "' failed: " << e.what());
        }
    }
}

std::string application_state_to_string(LifecycleManager::ApplicationState state) {
    switch (state) {
        case LifecycleManager::ApplicationState::STARTING: return "starting";
        case LifecycleManager::ApplicationState::RUNNING: return "running";
        case LifecycleManager::ApplicationState::STOPPING: return "stopping";
        case LifecycleManager::ApplicationState::STOPPED: return "stopped";
        case LifecycleManager::ApplicationState::FAILED: return "failed";
        default: return "unknown";
    }
}

} // namespace termlease
