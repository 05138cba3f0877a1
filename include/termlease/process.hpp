// include/termlease/process.hpp
// Purpose: Bounded subprocess execution for container runtime commands
// fork/exec with captured stdout/stderr; the child's process group is killed on timeout

#pragma once

#include "errors.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace termlease {

struct ProcessResult {
    int exit_code = -1;          // -1 if killed by a signal
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;

    bool success() const {
        return !timed_out && exit_code == 0;
    }
};

class ProcessRunner {
public:
    ProcessRunner() = default;
    virtual ~ProcessRunner() = default;

    // Runs argv[0] (resolved through PATH) and waits at most `timeout`.
    // Throws SystemError(SPAWN_FAILED) if the program cannot be executed.
    // The child is always reaped before returning.
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout);

    // Captured output beyond this many bytes per stream is discarded
    static constexpr size_t MAX_CAPTURE_BYTES = 64 * 1024;
};

} // namespace termlease
