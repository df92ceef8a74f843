#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace rpcstdio {

class RpcError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Spawn failure, connect timeout, early exit or reuse of a client.
class ConnectError : public RpcError {
public:
    using RpcError::RpcError;
};

class NotConnectedError : public RpcError {
public:
    NotConnectedError() : RpcError("Not connected") {}
};

class DisconnectedError : public RpcError {
public:
    DisconnectedError() : RpcError("Disconnected") {}
    explicit DisconnectedError(const std::string& reason) : RpcError(reason) {}
};

class TransportError : public RpcError {
public:
    using RpcError::RpcError;
};

class TimeoutError : public RpcError {
public:
    explicit TimeoutError(std::string method)
        : RpcError("Request timeout: " + method), method_(std::move(method)) {}

    const std::string& method() const { return method_; }

private:
    std::string method_;
};

/// Error object returned by the peer. what() is the peer's message.
class RemoteError : public RpcError {
public:
    RemoteError(int64_t code, const std::string& message, nlohmann::json data = nullptr)
        : RpcError(message), code_(code), data_(std::move(data)) {}

    int64_t code() const { return code_; }
    const nlohmann::json& data() const { return data_; }

private:
    int64_t code_;
    nlohmann::json data_;
};

} // namespace rpcstdio
