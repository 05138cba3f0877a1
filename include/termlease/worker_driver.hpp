// include/termlease/worker_driver.hpp
// Purpose: Start, probe and stop the isolated worker backing a session
// WorkerDriver is the seam; DockerWorkerDriver talks to a docker-compatible CLI

#pragma once

#include "types.hpp"
#include "config.hpp"
#include "process.hpp"
#include <memory>
#include <string>

namespace termlease {

// What to launch for a session
struct WorkerSpec {
    SessionId session_id;
    Port port = 0;               // host port the terminal is published on
    std::string image;
    Environment env;
};

class WorkerDriver {
public:
    virtual ~WorkerDriver() = default;

    // Blocks until the worker is confirmed running or the start timeout passes.
    // Throws WorkerError(START_FAILURE | START_TIMEOUT); nothing is left behind on failure.
    virtual WorkerRef start(const WorkerSpec& spec) = 0;

    // false if the worker is gone or stopped.
    // Throws WorkerError(HEALTH_CHECK_FAILED) when the runtime cannot answer.
    virtual bool is_alive(const WorkerRef& ref) = 0;

    // Succeeds if the worker is stopped or already gone.
    // Throws WorkerError(TEARDOWN_FAILURE) otherwise.
    virtual void stop(const WorkerRef& ref) = 0;
};

class DockerWorkerDriver : public WorkerDriver {
public:
    explicit DockerWorkerDriver(const WorkerConfig& config,
                                std::shared_ptr<ProcessRunner> runner = std::make_shared<ProcessRunner>());

    WorkerRef start(const WorkerSpec& spec) override;
    bool is_alive(const WorkerRef& ref) override;
    void stop(const WorkerRef& ref) override;

    // Container name for a session: <prefix><first 8 chars of the id>
    std::string container_name(const SessionId& session_id) const;

    // Exposed for tests
    std::vector<std::string> build_run_command(const WorkerSpec& spec) const;

private:
    WorkerConfig config_;
    std::shared_ptr<ProcessRunner> runner_;

    enum class ContainerState { RUNNING, NOT_RUNNING, MISSING };

    // Definite answer from `inspect`; throws on an inconclusive probe
    ContainerState inspect_state(const WorkerRef& ref, std::chrono::milliseconds timeout);

    // Best-effort removal after a failed start
    void force_remove(const std::string& name_or_ref);

    static bool is_missing_container(const ProcessResult& result);
    static std::string describe_failure(const ProcessResult& result);
};

} // namespace termlease
