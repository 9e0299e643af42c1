#include "bridge_client.hpp"
#include "cli_options.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

#include <unistd.h>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) {
    g_stop_requested = 1;
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config=PATH] [--log-config=PATH] [--host=HOST] [--port=PORT]"
                 " [--method=NAME] [--params=JSON] [--retries=N] [--watch] [-v|--version]"
              << std::endl;
}

// Accepts both "--name value" and "--name=value".
bool match_option(int argc, char** argv, int& i, const char* name, std::string& out) {
    const size_t len = std::strlen(name);
    if (std::strcmp(argv[i], name) == 0 && i + 1 < argc) {
        out = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        out = argv[i] + len + 1;
        return true;
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    std::string config_path = "game_bridge.json";
    std::optional<std::string> log_config;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<int> retries;
    std::string method;
    std::string params_text = "{}";
    bool watch = false;

    for (int i = 1; i < argc; ++i) {
        std::string value;

        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << VERSION_STRING << std::endl;
            std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }

        if (std::strcmp(argv[i], "--watch") == 0) {
            watch = true;
            continue;
        }

        if (match_option(argc, argv, i, "--config", value)) {
            config_path = value;
            continue;
        }

        if (match_option(argc, argv, i, "--log-config", value)) {
            log_config = value;
            continue;
        }

        if (match_option(argc, argv, i, "--host", value)) {
            host = value;
            continue;
        }

        if (match_option(argc, argv, i, "--port", value)) {
            int parsed = 0;
            if (!bridge::parse_int_in_range(value, 1, 65535, parsed)) {
                std::cerr << "Invalid port: " << value << std::endl;
                return 2;
            }
            port = parsed;
            continue;
        }

        if (match_option(argc, argv, i, "--retries", value)) {
            int parsed = 0;
            if (!bridge::parse_int_in_range(value, 1, std::numeric_limits<int>::max(), parsed)) {
                std::cerr << "Invalid retry count: " << value << std::endl;
                return 2;
            }
            retries = parsed;
            continue;
        }

        if (match_option(argc, argv, i, "--method", value)) {
            method = value;
            continue;
        }

        if (match_option(argc, argv, i, "--params", value)) {
            params_text = value;
            continue;
        }

        std::cerr << "Unknown argument: " << argv[i] << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    bridge::json params;
    try {
        params = bridge::json::parse(params_text);
    } catch (const bridge::json::parse_error& exc) {
        std::cerr << "Invalid --params JSON: " << exc.what() << std::endl;
        return 2;
    }
    if (!params.is_object()) {
        std::cerr << "--params must be a JSON object" << std::endl;
        return 2;
    }

    bridge::BridgeConfig config = bridge::load_config(config_path);
    if (log_config) {
        config.log_config = *log_config;
    }
    if (host) {
        config.host = *host;
    }
    if (port) {
        config.port = *port;
    }

    init_logging(config.log_config, config.log_level);

    LOG4CPLUS_INFO(core_logger(), "game_bridge starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Endpoint: " << config.host << ":" << config.port);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    bridge::BridgeClient client(config);

    // The first call reconnects when this fails.
    try {
        client.connect();
        client.handshake();
    } catch (const bridge::BridgeError& exc) {
        LOG4CPLUS_WARN(core_logger(), "Initial connection failed: " << exc.what() << ". Will retry on first call.");
    }

    int exit_code = 0;
    if (!method.empty()) {
        try {
            bridge::Response response = retries ? client.call_with_retry(method, params, *retries)
                                                : client.call_with_retry(method, params);
            std::cout << bridge::codec::response_to_json(response).dump(2) << std::endl;
            if (response.error) {
                exit_code = 1;
            }
        } catch (const bridge::BridgeError& exc) {
            LOG4CPLUS_ERROR(core_logger(), "Call " << method << " failed: " << exc.what());
            exit_code = 1;
        }
    }

    if (watch) {
        LOG4CPLUS_INFO(core_logger(), "Keeping connection alive, press Ctrl+C to stop");
        while (!g_stop_requested) {
            ::sleep(1);
        }
        LOG4CPLUS_INFO(core_logger(), "Received stop signal, shutting down");
    }

    client.disconnect();
    LOG4CPLUS_INFO(core_logger(), "game_bridge stopped");
    return exit_code;
}
