#include "client_options.hpp"

#include "json_codec.hpp"

#include <fstream>
#include <stdexcept>

namespace rpcstdio {

namespace {

std::chrono::milliseconds read_millis(const nlohmann::json& entry, const std::string& key,
                                      std::chrono::milliseconds fallback) {
    const auto* value = codec::find_key(entry, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_number_integer() || value->get<int64_t>() <= 0) {
        throw std::invalid_argument("'" + key + "' must be a positive integer (milliseconds)");
    }
    return std::chrono::milliseconds(value->get<int64_t>());
}

} // namespace

ClientOptions load_client_options(const nlohmann::json& entry) {
    if (!entry.is_object()) {
        throw std::invalid_argument("server entry must be an object");
    }

    ClientOptions options;

    const auto* command = codec::find_key(entry, "command");
    if (!command || !command->is_string() || command->get<std::string>().empty()) {
        throw std::invalid_argument("'command' is required");
    }
    options.command = command->get<std::string>();

    if (const auto* args = codec::find_key(entry, "args")) {
        if (!args->is_array()) {
            throw std::invalid_argument("'args' must be an array of strings");
        }
        for (const auto& arg : *args) {
            if (!arg.is_string()) {
                throw std::invalid_argument("'args' must be an array of strings");
            }
            options.args.push_back(arg.get<std::string>());
        }
    }

    if (const auto* env = codec::find_key(entry, "env")) {
        if (!env->is_object()) {
            throw std::invalid_argument("'env' must be an object of strings");
        }
        for (const auto& [key, value] : env->items()) {
            if (!value.is_string()) {
                throw std::invalid_argument("'env." + key + "' must be a string");
            }
            options.env[key] = value.get<std::string>();
        }
    }

    if (const auto* framing = codec::find_key(entry, "framing")) {
        options.framing = parse_framing(codec::as_string(*framing));
    }
    if (const auto* policy = codec::find_key(entry, "id_policy")) {
        options.id_policy = parse_id_policy(codec::as_string(*policy));
    }

    options.timeout = read_millis(entry, "timeout", options.timeout);
    options.connect_timeout = read_millis(entry, "connect_timeout", options.connect_timeout);
    options.kill_grace = read_millis(entry, "kill_grace", options.kill_grace);
    return options;
}

ClientOptions load_client_options_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::invalid_argument("cannot open " + path);
    }

    nlohmann::json entry = nlohmann::json::parse(in, nullptr, false);
    if (entry.is_discarded()) {
        throw std::invalid_argument(path + " is not valid JSON");
    }
    return load_client_options(entry);
}

} // namespace rpcstdio
