#include "request_tracker.hpp"

#include "errors.hpp"

#include <cstdio>
#include <stdexcept>

namespace rpcstdio {

IdPolicy default_id_policy(Framing framing) {
    return framing == Framing::content_length ? IdPolicy::sequential : IdPolicy::token;
}

IdPolicy parse_id_policy(const std::string& name) {
    if (name == "sequential") {
        return IdPolicy::sequential;
    }
    if (name == "token") {
        return IdPolicy::token;
    }
    throw std::invalid_argument("unknown id policy: " + name);
}

RequestTracker::RequestTracker(IdPolicy policy)
    : policy_(policy), rng_(std::random_device{}()) {}

RequestId RequestTracker::next_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (policy_ == IdPolicy::sequential) {
        return RequestId{++counter_};
    }
    return RequestId{generate_token()};
}

std::string RequestTracker::generate_token() {
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng_);
    uint64_t lo = dist(rng_);

    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buffer;
}

std::future<json> RequestTracker::add(const RequestId& id, const std::string& method, Clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.count(id) != 0) {
        throw std::logic_error("request id already pending: " + to_string(id));
    }

    PendingRequest entry{id, method, std::promise<json>(), deadline, Clock::now()};
    auto future = entry.promise.get_future();
    pending_.emplace(id, std::move(entry));
    ++stats_.created;
    return future;
}

std::optional<RequestTracker::PendingRequest> RequestTracker::take(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    PendingRequest entry = std::move(it->second);
    pending_.erase(it);
    ++stats_.settled;
    return entry;
}

bool RequestTracker::resolve(const Response& response) {
    auto entry = take(response.id);
    if (!entry) {
        return false;
    }

    if (response.error) {
        const auto& error = *response.error;
        entry->promise.set_exception(std::make_exception_ptr(
            RemoteError(error.code, error.message, error.data.value_or(json(nullptr)))));
    } else {
        entry->promise.set_value(response.result.value_or(json(nullptr)));
    }
    return true;
}

bool RequestTracker::fail(const RequestId& id, std::exception_ptr error) {
    auto entry = take(id);
    if (!entry) {
        return false;
    }
    entry->promise.set_exception(std::move(error));
    return true;
}

std::vector<RequestTracker::Expired> RequestTracker::expire(Clock::time_point now) {
    std::vector<PendingRequest> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                expired.push_back(std::move(it->second));
                it = pending_.erase(it);
                ++stats_.expired;
            } else {
                ++it;
            }
        }
    }

    std::vector<Expired> report;
    report.reserve(expired.size());
    for (auto& entry : expired) {
        entry.promise.set_exception(std::make_exception_ptr(TimeoutError(entry.method)));
        report.push_back({std::move(entry.id), std::move(entry.method), now - entry.created_at});
    }
    return report;
}

std::size_t RequestTracker::fail_all(const std::string& reason) {
    std::map<RequestId, PendingRequest> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.swap(pending_);
        stats_.settled += snapshot.size();
    }

    for (auto& [id, entry] : snapshot) {
        entry.promise.set_exception(std::make_exception_ptr(DisconnectedError(reason)));
    }
    return snapshot.size();
}

std::optional<RequestTracker::Clock::time_point> RequestTracker::next_deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<Clock::time_point> nearest;
    for (const auto& [id, entry] : pending_) {
        if (!nearest || entry.deadline < *nearest) {
            nearest = entry.deadline;
        }
    }
    return nearest;
}

std::size_t RequestTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool RequestTracker::contains(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) != 0;
}

RequestTracker::Stats RequestTracker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace rpcstdio
