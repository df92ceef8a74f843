#include "rpc_client.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>

#include <log4cplus/loggingmacros.h>

namespace rpcstdio {

namespace {

constexpr int kMaxEvents = 8;
constexpr int kMaxWaitMs = 1000;
constexpr std::size_t kReadChunk = 4096;
constexpr auto kExitCodeWait = std::chrono::milliseconds(100);

std::future<json> failed_future(std::exception_ptr error) {
    std::promise<json> promise;
    promise.set_exception(std::move(error));
    return promise.get_future();
}

} // namespace

RpcClient::RpcClient(ClientOptions options)
    : options_(std::move(options)),
      tracker_(options_.effective_id_policy()),
      decoder_(options_.framing) {}

RpcClient::~RpcClient() {
    disconnect();

    if (io_thread_.joinable()) {
        if (std::this_thread::get_id() == io_thread_.get_id()) {
            LOG4CPLUS_FATAL(client_logger(), "RpcClient destroyed from its own notification handler");
            std::terminate();
        }
        io_thread_.join();
    }
    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
    }
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
    }
}

void RpcClient::connect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    State expected = State::idle;
    if (!state_.compare_exchange_strong(expected, State::connecting)) {
        throw ConnectError("Already connected");
    }

    LOG4CPLUS_INFO(client_logger(), "Connecting to " << options_.command << " (framing="
                                                     << to_string(options_.framing) << ", timeout="
                                                     << options_.timeout.count() << "ms)");

    auto process = std::make_unique<ChildProcess>();
    try {
        SpawnOptions spawn;
        spawn.command = options_.command;
        spawn.args = options_.args;
        spawn.env = options_.env;
        spawn.exec_timeout = options_.connect_timeout;
        process->spawn(spawn);

        if (auto code = process->try_reap()) {
            throw ConnectError("Exit code " + std::to_string(*code));
        }
        process_ = std::move(process);
        setup_poller();
    } catch (const std::exception& e) {
        state_ = State::disconnected;
        LOG4CPLUS_ERROR(client_logger(), "Connect to " << options_.command << " failed: " << e.what());
        if (process_) {
            process_->terminate(options_.kill_grace);
        }
        throw;
    }

    expected = State::connecting;
    if (!state_.compare_exchange_strong(expected, State::connected)) {
        process_->terminate(options_.kill_grace);
        throw ConnectError("Disconnected while connecting");
    }

    running_ = true;
    io_thread_ = std::thread(&RpcClient::io_loop, this);
    LOG4CPLUS_INFO(client_logger(), "Connected to " << options_.command << " pid=" << process_->pid());
}

void RpcClient::setup_poller() {
    if (epoll_fd_ < 0) {
        epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            throw ConnectError(std::string("epoll_create1: ") + std::strerror(errno));
        }
    }
    if (wake_fd_ < 0) {
        wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        if (wake_fd_ < 0) {
            throw ConnectError(std::string("eventfd: ") + std::strerror(errno));
        }
    }

    for (int fd : {wake_fd_, process_->stdout_fd(), process_->stderr_fd()}) {
        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = fd;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            throw ConnectError(std::string("epoll_ctl: ") + std::strerror(errno));
        }
    }
    stdout_open_ = true;
    stderr_open_ = true;
}

std::future<json> RpcClient::request(const std::string& method, std::optional<json> params) {
    if (state_.load() != State::connected) {
        return failed_future(std::make_exception_ptr(NotConnectedError()));
    }

    RequestId id = tracker_.next_id();
    auto deadline = RequestTracker::Clock::now() + options_.timeout;
    auto future = tracker_.add(id, method, deadline);

    // disconnect() flips the state before failing the pending set
    if (state_.load() != State::connected) {
        tracker_.fail(id, std::make_exception_ptr(DisconnectedError()));
        return future;
    }

    LOG4CPLUS_DEBUG(client_logger(), "--> " << method << " id=" << to_string(id));
    if (!send(codec::encode(Request{id, method, std::move(params)}), deadline)) {
        // The I/O thread may already have expired it; fail() is then a no-op.
        if (RequestTracker::Clock::now() >= deadline) {
            tracker_.fail(id, std::make_exception_ptr(TimeoutError(method)));
        } else if (state_.load() != State::connected) {
            tracker_.fail(id, std::make_exception_ptr(DisconnectedError()));
        } else {
            tracker_.fail(id, std::make_exception_ptr(TransportError("Failed to write request: " + method)));
        }
        return future;
    }

    wake();
    return future;
}

json RpcClient::call(const std::string& method, std::optional<json> params) {
    return request(method, std::move(params)).get();
}

void RpcClient::notify(const std::string& method, std::optional<json> params) {
    if (state_.load() != State::connected) {
        LOG4CPLUS_DEBUG(client_logger(), "Not connected, dropping notification " << method);
        return;
    }

    LOG4CPLUS_DEBUG(client_logger(), "--> " << method << " (notification)");
    auto deadline = RequestTracker::Clock::now() + options_.timeout;
    if (!send(codec::encode(Notification{method, std::move(params)}), deadline)) {
        LOG4CPLUS_WARN(client_logger(), "Failed to write notification " << method);
    }
}

bool RpcClient::send(const json& message, RequestTracker::Clock::time_point deadline) {
    std::string payload = message.dump(-1, ' ', false, json::error_handler_t::replace);
    return process_ && process_->write_all(encode_frame(payload, options_.framing), deadline);
}

void RpcClient::disconnect() {
    State previous = state_.exchange(State::disconnected);
    std::size_t failed = tracker_.fail_all("Disconnected");
    running_ = false;

    if (previous == State::connected) {
        LOG4CPLUS_INFO(client_logger(), "Disconnecting from " << options_.command << ", "
                                                              << failed << " pending request(s) failed");
    }

    // From a notification handler: the loop exits on its own.
    if (std::this_thread::get_id() == io_thread_id_.load()) {
        if (process_) {
            process_->terminate(options_.kill_grace);
        }
        return;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    stop_io_thread();
    if (process_) {
        process_->terminate(options_.kill_grace);
    }
}

bool RpcClient::is_connected() const {
    return state_.load() == State::connected;
}

void RpcClient::set_notification_handler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    notification_handler_ = std::move(handler);
}

void RpcClient::stop_io_thread() {
    running_ = false;
    wake();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void RpcClient::wake() {
    if (wake_fd_ < 0) {
        return;
    }
    uint64_t one = 1;
    ssize_t written = ::write(wake_fd_, &one, sizeof(one));
    (void)written; // EAGAIN only means a wake-up is already queued
}

int RpcClient::next_wait_ms() const {
    auto deadline = tracker_.next_deadline();
    if (!deadline) {
        return kMaxWaitMs;
    }

    auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*deadline - RequestTracker::Clock::now());
    return static_cast<int>(std::clamp<int64_t>(remaining.count(), 0, kMaxWaitMs));
}

void RpcClient::io_loop() {
    io_thread_id_ = std::this_thread::get_id();
    epoll_event events[kMaxEvents];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, kMaxEvents, next_wait_ms());
        if (nfds < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(client_logger(), "epoll_wait: " << std::strerror(errno));
            on_peer_closed();
            break;
        }

        for (int i = 0; i < nfds && running_; ++i) {
            int fd = events[i].data.fd;
            if (fd == wake_fd_) {
                uint64_t value = 0;
                while (::read(wake_fd_, &value, sizeof(value)) > 0) {
                }
            } else if (stdout_open_ && fd == process_->stdout_fd()) {
                read_output();
            } else if (stderr_open_ && fd == process_->stderr_fd()) {
                read_errors();
            }
        }

        expire_requests();
    }

    io_thread_id_ = std::thread::id();
}

void RpcClient::read_output() {
    char buffer[kReadChunk];
    for (;;) {
        ssize_t n = ::read(process_->stdout_fd(), buffer, sizeof(buffer));
        if (n > 0) {
            for (const auto& payload : decoder_.feed(std::string_view(buffer, static_cast<std::size_t>(n)))) {
                route(payload);
            }
            if (!running_) {
                return;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0) {
            LOG4CPLUS_WARN(client_logger(), "read from peer failed: " << std::strerror(errno));
        }
        on_peer_closed();
        return;
    }
}

void RpcClient::read_errors() {
    char buffer[kReadChunk];
    for (;;) {
        ssize_t n = ::read(process_->stderr_fd(), buffer, sizeof(buffer));
        if (n > 0) {
            stderr_buffer_.append(buffer, static_cast<std::size_t>(n));
            flush_errors(false);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, process_->stderr_fd(), nullptr);
        stderr_open_ = false;
        flush_errors(true);
        return;
    }
}

void RpcClient::flush_errors(bool partial) {
    std::size_t start = 0;
    for (auto end = stderr_buffer_.find('\n'); end != std::string::npos; end = stderr_buffer_.find('\n', start)) {
        if (end > start) {
            LOG4CPLUS_INFO(peer_logger(), "[" << options_.command << "] " << stderr_buffer_.substr(start, end - start));
        }
        start = end + 1;
    }
    stderr_buffer_.erase(0, start);

    if (partial && !stderr_buffer_.empty()) {
        LOG4CPLUS_INFO(peer_logger(), "[" << options_.command << "] " << stderr_buffer_);
        stderr_buffer_.clear();
    }
}

void RpcClient::route(const std::string& payload) {
    auto message = codec::decode_message(payload);
    if (!message) {
        LOG4CPLUS_DEBUG(client_logger(), "Dropping undecodable payload (" << payload.size() << " bytes)");
        return;
    }

    if (const auto* response = std::get_if<Response>(&*message)) {
        if (!tracker_.resolve(*response)) {
            LOG4CPLUS_DEBUG(client_logger(), "No pending request for id=" << to_string(response->id));
        } else {
            LOG4CPLUS_DEBUG(client_logger(), "<-- id=" << to_string(response->id)
                                                      << (response->error ? " (error)" : ""));
        }
        return;
    }

    if (const auto* notification = std::get_if<Notification>(&*message)) {
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = notification_handler_;
        }
        if (!handler) {
            LOG4CPLUS_DEBUG(client_logger(), "Unobserved notification " << notification->method);
            return;
        }
        try {
            handler(*notification);
        } catch (const std::exception& e) {
            LOG4CPLUS_WARN(client_logger(), "Notification handler for " << notification->method
                                                                        << " threw: " << e.what());
        }
        return;
    }

    const auto& request = std::get<Request>(*message);
    LOG4CPLUS_DEBUG(client_logger(), "Ignoring peer request " << request.method << " id=" << to_string(request.id));
}

void RpcClient::expire_requests() {
    for (const auto& expired : tracker_.expire(RequestTracker::Clock::now())) {
        LOG4CPLUS_WARN(client_logger(), "Request timeout: " << expired.method << " id=" << to_string(expired.id)
                       << " after " << std::chrono::duration_cast<std::chrono::milliseconds>(expired.age).count()
                       << "ms");
    }
}

void RpcClient::on_peer_closed() {
    running_ = false;
    if (stdout_open_) {
        ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, process_->stdout_fd(), nullptr);
        stdout_open_ = false;
    }
    if (stderr_open_) {
        read_errors();
    }

    State previous = state_.exchange(State::disconnected);
    std::size_t failed = tracker_.fail_all("Disconnected");

    if (previous == State::connected) {
        if (process_->wait_for_exit(kExitCodeWait)) {
            LOG4CPLUS_WARN(client_logger(), options_.command << " exited with code " << *process_->try_reap()
                                                             << ", " << failed << " pending request(s) failed");
        } else {
            LOG4CPLUS_WARN(client_logger(), options_.command << " closed its output, "
                                                             << failed << " pending request(s) failed");
        }
    }
    process_->terminate(options_.kill_grace);
}

} // namespace rpcstdio
