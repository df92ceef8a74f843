#include "client_options.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "rpc_client.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <chrono>
#include <cstring>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--framing newline|content-length] [--timeout MS] [--connect-timeout MS]\n"
                 "       [--env KEY=VALUE]... [--server FILE.json] [--config LOG4CPLUS.ini]\n"
                 "       [--notify METHOD[=PARAMS]]... --method METHOD [--params JSON] [-- COMMAND ARGS...]\n";
}

std::optional<rpcstdio::json> parse_params(const std::string& text) {
    auto params = rpcstdio::json::parse(text, nullptr, false);
    if (params.is_discarded()) {
        throw std::invalid_argument("invalid JSON params: " + text);
    }
    return params;
}

std::chrono::milliseconds parse_millis(const std::string& text) {
    long long value = std::stoll(text);
    if (value <= 0) {
        throw std::invalid_argument("timeout must be positive: " + text);
    }
    return std::chrono::milliseconds(value);
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    std::string config_path = "log4cplus.ini";
    std::string server_path;
    std::string method;
    std::string params_text;
    std::vector<std::pair<std::string, std::string>> notifications;
    std::optional<rpcstdio::Framing> framing;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::map<std::string, std::string> env;
    std::vector<std::string> command;

    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
                std::cout << "Version: " << RPCSTDIO_VERSION_STRING << std::endl;
                std::cout << "Build Time: " << RPCSTDIO_BUILD_TIMESTAMP << std::endl;
                return 0;
            }

            if (strcmp(argv[i], "--") == 0) {
                command.assign(argv + i + 1, argv + argc);
                break;
            }

            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 2;
            }

            if (strcmp(argv[i], "--framing") == 0) {
                framing = rpcstdio::parse_framing(argv[++i]);
            } else if (strcmp(argv[i], "--timeout") == 0) {
                timeout = parse_millis(argv[++i]);
            } else if (strcmp(argv[i], "--connect-timeout") == 0) {
                connect_timeout = parse_millis(argv[++i]);
            } else if (strcmp(argv[i], "--env") == 0) {
                std::string pair = argv[++i];
                auto eq = pair.find('=');
                if (eq == std::string::npos || eq == 0) {
                    throw std::invalid_argument("--env expects KEY=VALUE, got " + pair);
                }
                env[pair.substr(0, eq)] = pair.substr(eq + 1);
            } else if (strcmp(argv[i], "--server") == 0) {
                server_path = argv[++i];
            } else if (strcmp(argv[i], "--config") == 0) {
                config_path = argv[++i];
            } else if (strcmp(argv[i], "--notify") == 0) {
                std::string entry = argv[++i];
                auto eq = entry.find('=');
                if (eq == std::string::npos) {
                    notifications.emplace_back(entry, "");
                } else {
                    notifications.emplace_back(entry.substr(0, eq), entry.substr(eq + 1));
                }
            } else if (strcmp(argv[i], "--method") == 0) {
                method = argv[++i];
            } else if (strcmp(argv[i], "--params") == 0) {
                params_text = argv[++i];
            } else {
                print_usage(argv[0]);
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    init_logging(config_path);

    if (method.empty() || (command.empty() && server_path.empty())) {
        print_usage(argv[0]);
        return 2;
    }

    rpcstdio::ClientOptions options;
    try {
        if (!server_path.empty()) {
            options = rpcstdio::load_client_options_file(server_path);
        }
    } catch (const std::invalid_argument& e) {
        LOG4CPLUS_ERROR(core_logger(), "Invalid server entry " << server_path << ": " << e.what());
        return 2;
    }

    if (!command.empty()) {
        options.command = command.front();
        options.args.assign(command.begin() + 1, command.end());
    }
    for (const auto& [key, value] : env) {
        options.env[key] = value;
    }
    if (framing) {
        options.framing = *framing;
    }
    if (timeout) {
        options.timeout = *timeout;
    }
    if (connect_timeout) {
        options.connect_timeout = *connect_timeout;
    }

    rpcstdio::RpcClient client(options);
    client.set_notification_handler([](const rpcstdio::Notification& notification) {
        LOG4CPLUS_INFO(core_logger(), "Peer notification " << notification.method << " "
                                                           << notification.params.value_or(nullptr).dump());
    });

    try {
        client.connect();

        for (const auto& [name, text] : notifications) {
            client.notify(name, text.empty() ? std::nullopt : parse_params(text));
        }

        auto params = params_text.empty() ? std::nullopt : parse_params(params_text);
        rpcstdio::json result = client.call(method, params);
        std::cout << result.dump(2) << std::endl;
    } catch (const rpcstdio::RemoteError& e) {
        LOG4CPLUS_ERROR(core_logger(), method << " failed: " << e.what() << " (code " << e.code() << ")");
        client.disconnect();
        return 1;
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(core_logger(), method << " failed: " << e.what());
        client.disconnect();
        return 1;
    }

    client.disconnect();
    return 0;
}
