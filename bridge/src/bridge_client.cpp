#include "bridge_client.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace bridge {

namespace {

CorrelatorOptions correlator_options(const BridgeConfig& config) {
    CorrelatorOptions options;
    options.ack_timeout = config.ack_timeout;
    options.strict_id_check = config.strict_id_check;
    return options;
}

HeartbeatOptions heartbeat_options(const BridgeConfig& config) {
    HeartbeatOptions options;
    options.interval = config.heartbeat_interval;
    options.join_timeout = config.heartbeat_join_timeout;
    options.lock_wait = config.heartbeat_lock_wait;
    options.max_retries = 1;
    return options;
}

} // namespace

BridgeClient::BridgeClient(BridgeConfig config)
    : BridgeClient(config, make_tcp_transport_factory(config.endpoint())) {}

BridgeClient::BridgeClient(BridgeConfig config, TransportFactory factory)
    : config_(std::move(config)),
      connection_(std::move(factory)),
      correlator_(connection_, correlator_options(config_)),
      retry_(connection_, correlator_, config_.reconnect_delay),
      heartbeat_(connection_, retry_, heartbeat_options(config_)) {
    connection_.set_connect_listener([this] { heartbeat_.start(); });
}

BridgeClient::~BridgeClient() {
    connection_.set_connect_listener(nullptr);
    heartbeat_.stop();
    connection_.disconnect();
}

void BridgeClient::connect() {
    LOG4CPLUS_DEBUG(client_logger(), "Connecting to " << config_.host << ":" << config_.port);
    connection_.connect();
}

void BridgeClient::disconnect() {
    heartbeat_.stop();
    connection_.disconnect();
}

bool BridgeClient::is_connected() {
    return connection_.is_connected();
}

Response BridgeClient::call(const std::string& method, const json& params) {
    return correlator_.call(method, params);
}

Response BridgeClient::call_with_retry(const std::string& method, const json& params) {
    return retry_.call_with_retry(method, params, config_.max_retries);
}

Response BridgeClient::call_with_retry(const std::string& method, const json& params, int max_retries) {
    return retry_.call_with_retry(method, params, max_retries);
}

std::optional<HandshakeInfo> BridgeClient::handshake() {
    Response response = correlator_.call(kHandshakeMethod, json::object());
    auto info = parse_handshake(response);
    if (!info) {
        return std::nullopt;
    }

    LOG4CPLUS_INFO(client_logger(), "Handshake successful: " << info->server_name << " v" << info->version);
    LOG4CPLUS_INFO(client_logger(), "Available methods: " << info->total_methods);
    for (const auto& [category, methods] : info->method_categories) {
        if (!methods.empty()) {
            LOG4CPLUS_DEBUG(client_logger(), "  " << category << ": " << methods.size() << " methods");
        }
    }
    if (info->instructions) {
        LOG4CPLUS_DEBUG(client_logger(), "Received server instructions");
    }
    return info;
}

} // namespace bridge
