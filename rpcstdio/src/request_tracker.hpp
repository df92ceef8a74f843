#pragma once

#include "frame_decoder.hpp"
#include "protocol.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace rpcstdio {

enum class IdPolicy {
    sequential, // 1, 2, 3, ... per connection
    token,      // random UUID v4 strings
};

/// Language servers expect small sequential ids, tool servers opaque tokens.
IdPolicy default_id_policy(Framing framing);

/// Accepts "sequential" and "token". Throws std::invalid_argument.
IdPolicy parse_id_policy(const std::string& name);

/**
 * Bookkeeping for in-flight requests: id issuance, the pending set and
 * per-request deadlines.
 *
 * Every registered request leaves the set exactly once, either settled
 * (response, failure, disconnect) or expired (deadline). Thread safe.
 */
class RequestTracker {
public:
    using Clock = std::chrono::steady_clock;

    struct Stats {
        uint64_t created = 0;
        uint64_t settled = 0; // deadline cancelled
        uint64_t expired = 0; // deadline fired
    };

    struct Expired {
        RequestId id;
        std::string method;
        Clock::duration age;
    };

    explicit RequestTracker(IdPolicy policy);

    RequestId next_id();

    /// Register a request. Throws std::logic_error if `id` is already pending.
    std::future<json> add(const RequestId& id, const std::string& method, Clock::time_point deadline);

    /// Complete the matching request from a response. Returns false when no
    /// request with that id is pending.
    bool resolve(const Response& response);

    bool fail(const RequestId& id, std::exception_ptr error);

    /// Fail every request whose deadline is at or before `now` with a
    /// TimeoutError.
    std::vector<Expired> expire(Clock::time_point now);

    /// Fail every pending request with a DisconnectedError.
    std::size_t fail_all(const std::string& reason);

    std::optional<Clock::time_point> next_deadline() const;
    std::size_t size() const;
    bool contains(const RequestId& id) const;
    Stats stats() const;
    IdPolicy policy() const { return policy_; }

private:
    struct PendingRequest {
        RequestId id;
        std::string method;
        std::promise<json> promise;
        Clock::time_point deadline;
        Clock::time_point created_at;
    };

    std::optional<PendingRequest> take(const RequestId& id);
    std::string generate_token();

    const IdPolicy policy_;
    mutable std::mutex mutex_;
    std::map<RequestId, PendingRequest> pending_;
    int64_t counter_ = 0;
    std::mt19937_64 rng_;
    Stats stats_;
};

} // namespace rpcstdio
