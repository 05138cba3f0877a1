// src/worker_driver.cpp
// Implementation of the docker-backed worker driver

#include "termlease/worker_driver.hpp"
#include "termlease/logger.hpp"
#include "termlease/utils.hpp"
#include <algorithm>
#include <thread>

namespace termlease {

namespace {
constexpr const char* LOG_COMPONENT = "worker";
constexpr std::chrono::milliseconds STARTUP_POLL_INTERVAL{250};
}

DockerWorkerDriver::DockerWorkerDriver(const WorkerConfig& config,
                                       std::shared_ptr<ProcessRunner> runner)
    : config_(config)
    , runner_(std::move(runner)) {
    if (!runner_) {
        runner_ = std::make_shared<ProcessRunner>();
    }
}

std::string DockerWorkerDriver::container_name(const SessionId& session_id) const {
    return config_.container_prefix + session_id.substr(0, 8);
}

std::vector<std::string> DockerWorkerDriver::build_run_command(const WorkerSpec& spec) const {
    std::vector<std::string> argv = {
        config_.runtime_binary, "run", "-d", "--rm",
        "--name", container_name(spec.session_id),
        "-p", std::to_string(spec.port) + ":" + std::to_string(config_.container_port),
        "--memory", config_.memory_limit,
        "--cpus", config_.cpu_limit,
        "-e", "SESSION_ID=" + spec.session_id
    };

    for (const auto& [key, value] : config_.environment) {
        argv.push_back("-e");
        argv.push_back(key + "=" + value);
    }
    for (const auto& [key, value] : spec.env) {
        argv.push_back("-e");
        argv.push_back(key + "=" + value);
    }

    argv.push_back(spec.image.empty() ? config_.image : spec.image);
    return argv;
}

WorkerRef DockerWorkerDriver::start(const WorkerSpec& spec) {
    auto timeout = std::min(config_.start_timeout,
                            std::chrono::milliseconds(Defaults::START_TIMEOUT_CEILING_MS));
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string name = container_name(spec.session_id);

    TL_LOG_DEBUG(LOG_COMPONENT, "Starting container " << name << " on port " << spec.port);

    ProcessResult result;
    try {
        result = runner_->run(build_run_command(spec), timeout);
    } catch (const SystemError& e) {
        throw Errors::start_failure(spec.session_id, e.what());
    }

    if (result.timed_out) {
        force_remove(name);
        throw Errors::start_timeout(spec.session_id, timeout);
    }
    if (result.exit_code != 0) {
        force_remove(name);
        throw Errors::start_failure(spec.session_id, describe_failure(result));
    }

    WorkerRef ref = Utils::trim(result.stdout_output);
    if (ref.empty()) {
        ref = name;
    }

    // `run -d` returns once the container is created; wait until it reports running
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        ContainerState state = ContainerState::NOT_RUNNING;
        try {
            state = inspect_state(ref, std::min(remaining, config_.health_check_timeout));
        } catch (const WorkerError& e) {
            TL_LOG_DEBUG(LOG_COMPONENT, "Startup probe for " << name << " inconclusive: " << e.what());
        }

        if (state == ContainerState::RUNNING) {
            TL_LOG_INFO(LOG_COMPONENT, "Container " << name << " running ("
                        << ref.substr(0, 12) << ")");
            return ref;
        }
        if (state == ContainerState::MISSING) {
            // Exited and was auto-removed; polling cannot bring it back
            throw Errors::start_failure(spec.session_id,
                "container " + name + " disappeared before reporting running");
        }

        std::this_thread::sleep_for(std::min(remaining, STARTUP_POLL_INTERVAL));
    }

    force_remove(ref);
    throw Errors::start_timeout(spec.session_id, timeout);
}

bool DockerWorkerDriver::is_alive(const WorkerRef& ref) {
    return inspect_state(ref, config_.health_check_timeout) == ContainerState::RUNNING;
}

void DockerWorkerDriver::stop(const WorkerRef& ref) {
    auto grace = std::max<int64_t>(1, config_.stop_timeout.count() / 2000);
    std::vector<std::string> argv = {
        config_.runtime_binary, "stop", "-t", std::to_string(grace), ref
    };

    ProcessResult result;
    try {
        result = runner_->run(argv, config_.stop_timeout);
    } catch (const SystemError& e) {
        throw Errors::teardown_failure(ref, e.what());
    }

    if (result.timed_out) {
        throw Errors::teardown_failure(ref, "stop timed out after " +
            std::to_string(config_.stop_timeout.count()) + "ms");
    }
    if (result.exit_code != 0) {
        if (is_missing_container(result)) {
            TL_LOG_DEBUG(LOG_COMPONENT, "Container " << ref.substr(0, 12) << " already gone");
            return;
        }
        throw Errors::teardown_failure(ref, describe_failure(result));
    }

    TL_LOG_DEBUG(LOG_COMPONENT, "Container " << ref.substr(0, 12) << " stopped");
}

DockerWorkerDriver::ContainerState DockerWorkerDriver::inspect_state(const WorkerRef& ref,
                                                                     std::chrono::milliseconds timeout) {
    std::vector<std::string> argv = {
        config_.runtime_binary, "inspect", "-f", "{{.State.Running}}", ref
    };

    ProcessResult result;
    try {
        result = runner_->run(argv, timeout);
    } catch (const SystemError& e) {
        throw Errors::health_check_failed(ref, e.what());
    }

    if (result.timed_out) {
        throw Errors::health_check_failed(ref, "inspect timed out after " +
            std::to_string(timeout.count()) + "ms");
    }
    if (result.exit_code != 0) {
        if (is_missing_container(result)) {
            return ContainerState::MISSING;
        }
        throw Errors::health_check_failed(ref, describe_failure(result));
    }

    return Utils::trim(result.stdout_output) == "true" ? ContainerState::RUNNING : ContainerState::NOT_RUNNING;
}

void DockerWorkerDriver::force_remove(const std::string& name_or_ref) {
    std::vector<std::string> argv = {config_.runtime_binary, "rm", "-f", name_or_ref};
    try {
        ProcessResult result = runner_->run(argv, config_.stop_timeout);
        if (!result.success() && !is_missing_container(result)) {
            TL_LOG_WARN(LOG_COMPONENT, "Failed to remove " << name_or_ref << ": "
                        << describe_failure(result));
        }
    } catch (const SystemError& e) {
        TL_LOG_WARN(LOG_COMPONENT, "Failed to remove " << name_or_ref << ": " << e.what());
    }
}

bool DockerWorkerDriver::is_missing_container(const ProcessResult& result) {
    std::string err = Utils::to_lower(result.stderr_output);
    return err.find("no such container") != std::string::npos ||
           err.find("no such object") != std::string::npos;
}

std::string DockerWorkerDriver::describe_failure(const ProcessResult& result) {
    std::string detail = Utils::trim(result.stderr_output);
    if (detail.empty()) {
        detail = Utils::trim(result.stdout_output);
    }
    if (detail.length() > 512) {
        detail = detail.substr(0, 512) + "...";
    }
    return "exit code " + std::to_string(result.exit_code) + (detail.empty() ? "" : ": " + detail);
}

} // namespace termlease
