#pragma once

#include "frame_decoder.hpp"
#include "request_tracker.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rpcstdio {

struct ClientOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    Framing framing = Framing::newline;
    std::chrono::milliseconds timeout{30000};         // per request
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds kill_grace{1000};       // SIGTERM -> SIGKILL
    std::optional<IdPolicy> id_policy;                // default follows framing

    IdPolicy effective_id_policy() const { return id_policy.value_or(default_id_policy(framing)); }
};

/**
 * Read a server entry:
 *
 *   {"command": "pylsp", "args": [], "env": {"K": "V"},
 *    "framing": "content-length", "timeout": 10000,
 *    "connect_timeout": 5000, "kill_grace": 1000, "id_policy": "sequential"}
 *
 * Only "command" is required. Throws std::invalid_argument on bad entries.
 */
ClientOptions load_client_options(const nlohmann::json& entry);

ClientOptions load_client_options_file(const std::string& path);

} // namespace rpcstdio
