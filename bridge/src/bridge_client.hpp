#pragma once

#include "call_correlator.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "handshake.hpp"
#include "heartbeat.hpp"
#include "protocol.hpp"
#include "retry_policy.hpp"

#include <optional>
#include <string>

namespace bridge {

/**
 * The whole surface collaborators depend on: one explicitly owned connection
 * to the game plus its correlator, retry policy and heartbeat daemon.
 *
 * Lifecycle is construction -> connect() -> calls -> disconnect(). The
 * heartbeat daemon starts with the first successful connect and stops on
 * disconnect().
 */
class BridgeClient {
public:
    explicit BridgeClient(BridgeConfig config);
    BridgeClient(BridgeConfig config, TransportFactory factory);
    ~BridgeClient();

    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;

    void connect();
    void disconnect();
    bool is_connected();

    Response call(const std::string& method, const json& params = json::object());
    Response call_with_retry(const std::string& method, const json& params = json::object());
    Response call_with_retry(const std::string& method, const json& params, int max_retries);

    /// Perform the "handshake" call and parse the advertised capabilities.
    std::optional<HandshakeInfo> handshake();

    HeartbeatDaemon& heartbeat() { return heartbeat_; }

private:
    BridgeConfig config_;
    Connection connection_;
    CallCorrelator correlator_;
    RetryPolicy retry_;
    HeartbeatDaemon heartbeat_;
};

} // namespace bridge
