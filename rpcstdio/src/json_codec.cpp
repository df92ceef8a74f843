#include "json_codec.hpp"

namespace rpcstdio {

std::string to_string(const RequestId& id) {
    if (const auto* number = std::get_if<int64_t>(&id)) {
        return std::to_string(*number);
    }
    return std::get<std::string>(id);
}

} // namespace rpcstdio

namespace rpcstdio::codec {

namespace {

constexpr const char* kVersion = "2.0";

std::optional<ErrorObject> decode_error(const json& value) {
    if (!value.is_object()) {
        return std::nullopt;
    }
    const json* code = find_key(value, "code");
    const json* message = find_key(value, "message");
    if (!code || !code->is_number_integer() || !message || !message->is_string()) {
        return std::nullopt;
    }

    ErrorObject error;
    error.code = code->get<int64_t>();
    error.message = message->get<std::string>();
    if (const json* data = find_key(value, "data")) {
        error.data = *data;
    }
    return error;
}

std::optional<json> optional_member(const json& root, const std::string& key) {
    if (const json* value = find_key(root, key)) {
        return *value;
    }
    return std::nullopt;
}

json envelope() {
    return json{{"jsonrpc", kVersion}};
}

} // namespace

std::optional<Message> decode_message(std::string_view payload) {
    json root = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return std::nullopt;
    }

    if (const json* version = find_key(root, "jsonrpc")) {
        if (!version->is_string() || version->get<std::string>() != kVersion) {
            return std::nullopt;
        }
    }

    const json* method = find_key(root, "method");
    if (method && !method->is_string()) {
        return std::nullopt;
    }

    const json* id_value = find_key(root, "id");
    if (!id_value) {
        if (!method) {
            return std::nullopt;
        }
        return Notification{method->get<std::string>(), optional_member(root, "params")};
    }

    auto id = id_from_json(*id_value);
    if (!id) {
        return std::nullopt;
    }

    if (method) {
        return Request{*id, method->get<std::string>(), optional_member(root, "params")};
    }

    const json* result = find_key(root, "result");
    const json* error = find_key(root, "error");
    if ((result == nullptr) == (error == nullptr)) {
        return std::nullopt;
    }

    Response response;
    response.id = std::move(*id);
    if (result) {
        response.result = *result;
    } else {
        response.error = decode_error(*error);
        if (!response.error) {
            return std::nullopt;
        }
    }
    return response;
}

json encode(const Request& request) {
    json message = envelope();
    message["id"] = id_to_json(request.id);
    message["method"] = request.method;
    if (request.params) {
        message["params"] = *request.params;
    }
    return message;
}

json encode(const Notification& notification) {
    json message = envelope();
    message["method"] = notification.method;
    if (notification.params) {
        message["params"] = *notification.params;
    }
    return message;
}

json encode(const Response& response) {
    json message = envelope();
    message["id"] = id_to_json(response.id);
    if (response.error) {
        json error = {{"code", response.error->code}, {"message", response.error->message}};
        if (response.error->data) {
            error["data"] = *response.error->data;
        }
        message["error"] = std::move(error);
    } else {
        message["result"] = response.result.value_or(json(nullptr));
    }
    return message;
}

json id_to_json(const RequestId& id) {
    if (const auto* number = std::get_if<int64_t>(&id)) {
        return *number;
    }
    return std::get<std::string>(id);
}

std::optional<RequestId> id_from_json(const json& value) {
    if (value.is_string()) {
        return RequestId{value.get<std::string>()};
    }
    if (value.is_number_integer()) {
        return RequestId{value.get<int64_t>()};
    }
    return std::nullopt;
}

const json* find_key(const json& obj, const std::string& key) {
    if (!obj.is_object()) {
        return nullptr;
    }

    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const json& obj, const std::string& fallback) {
    if (obj.is_string()) {
        return obj.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const json& obj, int64_t fallback) {
    if (obj.is_number_integer()) {
        return obj.get<int64_t>();
    }
    return fallback;
}

} // namespace rpcstdio::codec
