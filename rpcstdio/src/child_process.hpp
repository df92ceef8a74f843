#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace rpcstdio {

struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // merged over the current environment
    std::chrono::milliseconds exec_timeout{30000};
    bool parent_death_signal = true;        // Linux: SIGTERM the child if we die
};

/**
 * A child process with its three standard streams connected to pipes.
 *
 * stdout and stderr are non-blocking and meant to be polled by the owner;
 * stdin writes are blocking and serialised. Reaping goes through one mutex so
 * exit detection, termination and the destructor never race on waitpid().
 */
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// fork/exec the command. Throws ConnectError when exec fails or does not
    /// complete within `exec_timeout`.
    void spawn(const SpawnOptions& options);

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    using Clock = std::chrono::steady_clock;

    /**
     * Write the whole buffer to the child's stdin. False once stdin is
     * closed, the pipe is broken, `deadline` passes or terminate() is called
     * while the child is not reading. A write abandoned halfway closes stdin,
     * since the peer would only see a torn frame.
     */
    bool write_all(std::string_view data, std::optional<Clock::time_point> deadline = std::nullopt);
    void close_stdin();

    /// Non-blocking check. Returns the exit code once the child has exited
    /// (128 + signal number when killed by a signal).
    std::optional<int> try_reap();
    bool running();

    /**
     * SIGTERM now; SIGKILL from a background thread if the child is still
     * alive after `grace`. Returns without waiting for the child or for a
     * write in progress. Only the first call acts.
     */
    void terminate(std::chrono::milliseconds grace);

    /// Block until the child is gone, at most `timeout`. Returns true if reaped.
    bool wait_for_exit(std::chrono::milliseconds timeout);

private:
    std::optional<int> reap(bool block);
    void kill_and_reap();
    void close_fds();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::mutex stdin_mutex_;
    std::mutex reap_mutex_;
    bool reaped_ = false;
    int exit_code_ = 0;

    std::atomic<bool> terminating_{false};
    std::thread killer_;
};

} // namespace rpcstdio
