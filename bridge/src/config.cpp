#include "config.hpp"

#include "logger.hpp"
#include "protocol.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <log4cplus/loggingmacros.h>

namespace bridge {

namespace {

std::chrono::milliseconds seconds_field(const json& data, const char* key, std::chrono::milliseconds fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number()) {
        throw std::invalid_argument(std::string(key) + " must be a number of seconds");
    }
    double seconds = it->get<double>();
    if (seconds < 0.0) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

double to_seconds(std::chrono::milliseconds value) {
    return static_cast<double>(value.count()) / 1000.0;
}

} // namespace

TcpEndpoint BridgeConfig::endpoint() const {
    TcpEndpoint ep;
    ep.host = host;
    ep.port = port;
    ep.connect_timeout = connect_timeout;
    ep.read_timeout = read_timeout;
    return ep;
}

BridgeConfig config_from_json(const json& data) {
    if (!data.is_object()) {
        throw std::invalid_argument("configuration root must be an object");
    }

    BridgeConfig defaults;
    BridgeConfig config;
    config.host = data.value("host", defaults.host);
    config.port = data.value("port", defaults.port);
    if (config.port <= 0 || config.port > 65535) {
        throw std::invalid_argument("port out of range: " + std::to_string(config.port));
    }

    config.connect_timeout = seconds_field(data, "connection_timeout", defaults.connect_timeout);
    config.read_timeout = seconds_field(data, "read_timeout", defaults.read_timeout);
    config.ack_timeout = seconds_field(data, "ack_timeout", defaults.ack_timeout);
    config.reconnect_delay = seconds_field(data, "reconnect_delay", defaults.reconnect_delay);
    config.heartbeat_interval = seconds_field(data, "heartbeat_interval", defaults.heartbeat_interval);
    config.heartbeat_join_timeout = seconds_field(data, "heartbeat_join_timeout", defaults.heartbeat_join_timeout);
    config.heartbeat_lock_wait = seconds_field(data, "heartbeat_lock_wait", defaults.heartbeat_lock_wait);
    if (config.read_timeout <= config.heartbeat_interval) {
        throw std::invalid_argument("read_timeout must exceed heartbeat_interval");
    }

    config.max_retries = data.value("max_retries", defaults.max_retries);
    config.strict_id_check = data.value("strict_id_check", defaults.strict_id_check);
    config.log_level = data.value("log_level", defaults.log_level);
    config.log_config = data.value("log_config", defaults.log_config);
    return config;
}

BridgeConfig load_config(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG4CPLUS_DEBUG(core_logger(), "Config file " << path << " not found, using defaults");
        return BridgeConfig{};
    }

    try {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw std::runtime_error("cannot open file");
        }
        json data = json::parse(in);
        return config_from_json(data);
    } catch (const std::exception& exc) {
        LOG4CPLUS_WARN(core_logger(), "Failed to load config from " << path << ": " << exc.what()
                                                                     << ". Using defaults.");
        return BridgeConfig{};
    }
}

json config_to_json(const BridgeConfig& config) {
    return {
        {"host", config.host},
        {"port", config.port},
        {"connection_timeout", to_seconds(config.connect_timeout)},
        {"read_timeout", to_seconds(config.read_timeout)},
        {"ack_timeout", to_seconds(config.ack_timeout)},
        {"reconnect_delay", to_seconds(config.reconnect_delay)},
        {"heartbeat_interval", to_seconds(config.heartbeat_interval)},
        {"heartbeat_join_timeout", to_seconds(config.heartbeat_join_timeout)},
        {"heartbeat_lock_wait", to_seconds(config.heartbeat_lock_wait)},
        {"max_retries", config.max_retries},
        {"strict_id_check", config.strict_id_check},
        {"log_level", config.log_level},
        {"log_config", config.log_config},
    };
}

void save_config(const BridgeConfig& config, const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open " + path + " for writing");
    }
    out << config_to_json(config).dump(2) << '\n';
    if (!out.good()) {
        throw std::runtime_error("Failed writing " + path);
    }
}

} // namespace bridge
