#pragma once

#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace bridge {

struct BridgeConfig {
    std::string host = "localhost";
    int port = 8765;

    std::chrono::milliseconds connect_timeout{5000};
    // Must exceed heartbeat_interval so idle periods are not taken for a dead link.
    std::chrono::milliseconds read_timeout{90000};
    std::chrono::milliseconds ack_timeout{5000};
    std::chrono::milliseconds reconnect_delay{1000};

    std::chrono::milliseconds heartbeat_interval{60000};
    std::chrono::milliseconds heartbeat_join_timeout{2000};
    std::chrono::milliseconds heartbeat_lock_wait{1000};

    int max_retries = 3;
    bool strict_id_check = false;

    std::string log_level = "DEBUG";
    std::string log_config = "log4cplus.ini";

    TcpEndpoint endpoint() const;
};

/// Throws std::invalid_argument on a bad value, including a read_timeout that
/// does not exceed heartbeat_interval.
BridgeConfig config_from_json(const nlohmann::json& data);

/**
 * Load configuration from a JSON file.
 *
 * A missing file yields the defaults. A file that cannot be parsed, or that
 * carries a field of the wrong type, is reported as a warning and also yields
 * the defaults.
 */
BridgeConfig load_config(const std::string& path);

nlohmann::json config_to_json(const BridgeConfig& config);

/// Throws std::runtime_error when the file cannot be written.
void save_config(const BridgeConfig& config, const std::string& path);

} // namespace bridge
