#pragma once

#include "child_process.hpp"
#include "client_options.hpp"
#include "frame_decoder.hpp"
#include "protocol.hpp"
#include "request_tracker.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace rpcstdio {

/**
 * JSON-RPC 2.0 client for a peer running as a child process and talking
 * over its stdin/stdout.
 *
 * Lifecycle is idle -> connecting -> connected -> disconnected; a
 * disconnected client cannot be reconnected. Once connected, one I/O thread
 * reads the peer's output, matches responses to pending requests and fires
 * request deadlines. Public methods may be called from any thread.
 *
 * The notification handler may call disconnect(), but it must never destroy
 * the client: the I/O thread is still running the handler and keeps using
 * the client's members after it returns. Doing so terminates the process.
 */
class RpcClient {
public:
    /// Runs on the I/O thread. Must not block for long or destroy the client.
    using NotificationHandler = std::function<void(const Notification&)>;

    explicit RpcClient(ClientOptions options);
    ~RpcClient();

    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    /// Spawn the peer. Throws ConnectError.
    void connect();

    /**
     * Send a request. The future yields the peer's result or holds
     * RemoteError, TimeoutError, DisconnectedError, NotConnectedError or
     * TransportError.
     */
    std::future<json> request(const std::string& method, std::optional<json> params = std::nullopt);

    /// request() and wait.
    json call(const std::string& method, std::optional<json> params = std::nullopt);

    /// Fire and forget. Silently dropped when not connected. Gives up after
    /// the request timeout if the peer stops reading.
    void notify(const std::string& method, std::optional<json> params = std::nullopt);

    /// Idempotent. Pending requests fail right away; the peer gets SIGTERM,
    /// then SIGKILL after the kill grace period.
    void disconnect();

    bool is_connected() const;

    void set_notification_handler(NotificationHandler handler);

    const ClientOptions& options() const { return options_; }

private:
    enum class State { idle, connecting, connected, disconnected };

    void setup_poller();
    void io_loop();
    void stop_io_thread();
    void wake();
    int next_wait_ms() const;

    void read_output();
    void read_errors();
    void flush_errors(bool partial);
    void route(const std::string& payload);
    void expire_requests();
    void on_peer_closed();

    bool send(const json& message, RequestTracker::Clock::time_point deadline);

    ClientOptions options_;
    RequestTracker tracker_;
    FrameDecoder decoder_;        // I/O thread only
    std::string stderr_buffer_;   // I/O thread only
    std::unique_ptr<ChildProcess> process_;

    std::atomic<State> state_{State::idle};
    std::mutex lifecycle_mutex_;

    std::thread io_thread_;
    std::atomic<std::thread::id> io_thread_id_{};
    std::atomic<bool> running_{false};
    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    bool stdout_open_ = false;
    bool stderr_open_ = false;

    std::mutex handler_mutex_;
    NotificationHandler notification_handler_;
};

} // namespace rpcstdio
