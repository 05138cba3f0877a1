// src/process.cpp
// Implementation of the bounded subprocess runner

#include "termlease/process.hpp"
#include <cerrno>
#include <cstring>
#include <csignal>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace termlease {

namespace {

constexpr useconds_t REAP_POLL_INTERVAL_US = 5000;

// Closes a descriptor once; safe to call repeatedly
void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int read_fd = -1;
    int write_fd = -1;

    ~PipePair() {
        close_fd(read_fd);
        close_fd(write_fd);
    }
};

void open_pipe(PipePair& pair, const std::string& program) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw Errors::spawn_failed(program, errno);
    }
    pair.read_fd = fds[0];
    pair.write_fd = fds[1];
}

int wait_for_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // anonymous namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        throw SystemError(ErrorCode::SPAWN_FAILED, "Empty command line");
    }

    const std::string& program = argv.front();

    PipePair out_pipe;
    PipePair err_pipe;
    PipePair exec_pipe;  // carries errno from a failed execvp; closed by a successful exec
    open_pipe(out_pipe, program);
    open_pipe(err_pipe, program);
    open_pipe(exec_pipe, program);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t child = ::fork();
    if (child < 0) {
        throw Errors::spawn_failed(program, errno);
    }

    if (child == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe.write_fd, STDOUT_FILENO);
        ::dup2(err_pipe.write_fd, STDERR_FILENO);
        ::execvp(args[0], args.data());
        int exec_errno = errno;
        ssize_t ignored = ::write(exec_pipe.write_fd, &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    ::setpgid(child, child);
    close_fd(out_pipe.write_fd);
    close_fd(err_pipe.write_fd);
    close_fd(exec_pipe.write_fd);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_fd, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_for_child(child);
        throw Errors::spawn_failed(program, exec_errno);
    }

    ProcessResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    struct pollfd fds[2];
    fds[0] = {out_pipe.read_fd, POLLIN, 0};
    fds[1] = {err_pipe.read_fd, POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_output, &result.stderr_output};
    int open_streams = 2;
    char buffer[4096];

    while (open_streams > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        int ready = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.timed_out = true;
            break;
        }
        if (ready == 0) {
            result.timed_out = true;
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t bytes = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (bytes > 0) {
                if (sinks[i]->size() < MAX_CAPTURE_BYTES) {
                    sinks[i]->append(buffer, static_cast<size_t>(bytes));
                }
            } else if (bytes == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }

    // Output may close before the child exits; the deadline still applies
    while (!result.timed_out) {
        int status = 0;
        pid_t done = ::waitpid(child, &status, WNOHANG);
        if (done == child) {
            result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return result;
        }
        if (done < 0 && errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        ::usleep(REAP_POLL_INTERVAL_US);
    }

    ::kill(-child, SIGKILL);
    result.exit_code = wait_for_child(child);
    return result;
}

} // namespace termlease
