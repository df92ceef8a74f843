#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace rpcstdio {

using json = nlohmann::json;

/// JSON-RPC ids are either integers or strings. `null` ids are never issued
/// and never matched.
using RequestId = std::variant<int64_t, std::string>;

std::string to_string(const RequestId& id);

struct ErrorObject {
    int64_t code = 0;
    std::string message;
    std::optional<json> data;
};

struct Request {
    RequestId id;
    std::string method;
    std::optional<json> params;
};

struct Notification {
    std::string method;
    std::optional<json> params;
};

struct Response {
    RequestId id;
    std::optional<json> result;     // exactly one of result/error is set
    std::optional<ErrorObject> error;
};

using Message = std::variant<Request, Notification, Response>;

} // namespace rpcstdio
