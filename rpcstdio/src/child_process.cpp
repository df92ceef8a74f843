#include "child_process.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif

#include <cerrno>
#include <cstring>

#include <log4cplus/loggingmacros.h>

extern char** environ;

namespace rpcstdio {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);
constexpr int kWritePollMs = 20;

void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::vector<std::string> merged_environment(const std::map<std::string, std::string>& overlay) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view text(*entry);
        auto eq = text.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        merged.emplace(std::string(text.substr(0, eq)), std::string(text.substr(eq + 1)));
    }
    for (const auto& [key, value] : overlay) {
        merged[key] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        result.push_back(key + "=" + value);
    }
    return result;
}

} // namespace

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !terminating_.load()) {
        terminate(std::chrono::milliseconds(1000));
    }
    if (killer_.joinable()) {
        killer_.join();
    }
    close_fds();
}

void ChildProcess::spawn(const SpawnOptions& options) {
    if (pid_ > 0) {
        throw ConnectError("Already connected");
    }
    ignore_sigpipe_once();

    // Everything the child needs is built before fork().
    std::vector<std::string> env_strings = merged_environment(options.env);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::string command = options.command;
    std::vector<std::string> args = options.args;
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(command.data());
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe2(stdin_pipe, O_CLOEXEC) == -1 || ::pipe2(stdout_pipe, O_CLOEXEC) == -1 ||
        ::pipe2(stderr_pipe, O_CLOEXEC) == -1 || ::pipe2(status_pipe, O_CLOEXEC) == -1) {
        int err = errno;
        close_all();
        throw ConnectError(std::string("pipe: ") + std::strerror(err));
    }

#ifdef __linux__
    pid_t parent = ::getpid();
#endif
    pid_t pid = ::fork();
    if (pid == -1) {
        int err = errno;
        close_all();
        throw ConnectError(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
#ifdef __linux__
        if (options.parent_death_signal) {
            ::prctl(PR_SET_PDEATHSIG, SIGTERM);
            if (::getppid() != parent) {
                ::_exit(127);
            }
        }
#endif
        ::signal(SIGPIPE, SIG_DFL);

        // dup2 clears FD_CLOEXEC on the targets; every other pipe end closes on exec
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);

        ::execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    pid_ = pid;
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];

    // The status pipe closes without data once exec succeeded.
    pollfd pfd{status_pipe[0], POLLIN, 0};
    int ready;
    do {
        ready = ::poll(&pfd, 1, static_cast<int>(options.exec_timeout.count()));
    } while (ready < 0 && errno == EINTR);

    if (ready == 0) {
        close_fd(status_pipe[0]);
        LOG4CPLUS_ERROR(process_logger(), "exec of " << options.command << " did not complete within "
                                                     << options.exec_timeout.count() << "ms");
        kill_and_reap();
        close_fds();
        throw ConnectError("Connection timeout (" + std::to_string(options.exec_timeout.count()) + "ms)");
    }

    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        LOG4CPLUS_ERROR(process_logger(), "exec " << options.command << " failed: " << std::strerror(exec_errno));
        reap(true);
        close_fds();
        pid_ = -1;
        throw ConnectError("spawn " + options.command + ": " + std::strerror(exec_errno));
    }

    set_nonblocking(stdin_fd_);
    set_nonblocking(stdout_fd_);
    set_nonblocking(stderr_fd_);
    LOG4CPLUS_INFO(process_logger(), "Spawned " << options.command << " pid=" << pid_);
}

bool ChildProcess::write_all(std::string_view data, std::optional<Clock::time_point> deadline) {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    if (stdin_fd_ < 0) {
        return false;
    }

    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (written >= 0) {
            offset += static_cast<std::size_t>(written);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG4CPLUS_WARN(process_logger(), "write to pid=" << pid_ << " failed: " << std::strerror(errno));
            return false;
        }

        // Pipe full: wait in short slices so terminate() and the deadline are noticed.
        bool expired = deadline && Clock::now() >= *deadline;
        if (expired || terminating_.load()) {
            LOG4CPLUS_WARN(process_logger(), "pid=" << pid_ << " is not reading stdin, abandoned write after "
                                                    << offset << " of " << data.size() << " bytes");
            if (offset > 0) {
                close_fd(stdin_fd_);
            }
            return false;
        }
        pollfd pfd{stdin_fd_, POLLOUT, 0};
        int ready = ::poll(&pfd, 1, kWritePollMs);
        if (ready < 0 && errno != EINTR) {
            LOG4CPLUS_WARN(process_logger(), "poll on stdin of pid=" << pid_ << " failed: " << std::strerror(errno));
            return false;
        }
    }
    return true;
}

void ChildProcess::close_stdin() {
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    close_fd(stdin_fd_);
}

std::optional<int> ChildProcess::reap(bool block) {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (reaped_) {
        return exit_code_;
    }
    if (pid_ <= 0) {
        return std::nullopt;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return std::nullopt;
    }
    reaped_ = true;
    exit_code_ = result < 0 ? -1 : decode_status(status);
    LOG4CPLUS_DEBUG(process_logger(), "pid=" << pid_ << " exited with code " << exit_code_);
    return exit_code_;
}

std::optional<int> ChildProcess::try_reap() {
    return reap(false);
}

bool ChildProcess::running() {
    return pid_ > 0 && !reap(false).has_value();
}

void ChildProcess::kill_and_reap() {
    if (pid_ > 0 && !reap(false)) {
        ::kill(pid_, SIGKILL);
        reap(true);
    }
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (pid_ <= 0 || terminating_.exchange(true)) {
        return;
    }

    // Signal first: a writer blocked on a full pipe holds the stdin mutex
    // until it sees terminating_.
    if (running()) {
        LOG4CPLUS_DEBUG(process_logger(), "SIGTERM pid=" << pid_);
        ::kill(pid_, SIGTERM);

        killer_ = std::thread([this, grace]() {
            if (wait_for_exit(grace)) {
                return;
            }
            LOG4CPLUS_WARN(process_logger(), "pid=" << pid_ << " ignored SIGTERM for " << grace.count()
                                                    << "ms, sending SIGKILL");
            kill_and_reap();
        });
    }
    close_stdin();
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (reap(false)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

void ChildProcess::close_fds() {
    close_stdin();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

} // namespace rpcstdio
