#pragma once

#include "protocol.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace rpcstdio::codec {

/// Parse one decoded frame. Returns nullopt for payloads that are not JSON or
/// not a valid request, notification or response.
std::optional<Message> decode_message(std::string_view payload);

json encode(const Request& request);
json encode(const Notification& notification);
json encode(const Response& response);

json id_to_json(const RequestId& id);
std::optional<RequestId> id_from_json(const json& value);

const json* find_key(const json& obj, const std::string& key);
std::string as_string(const json& obj, const std::string& fallback = "");
int64_t as_int64(const json& obj, int64_t fallback = 0);

} // namespace rpcstdio::codec
