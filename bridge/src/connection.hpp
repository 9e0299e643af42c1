#pragma once

#include "protocol.hpp"
#include "transport.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace bridge {

/**
 * Owns the single transport to the game and its lifecycle state.
 *
 * The state and the transport are only touched while holding the exchange
 * mutex, which also serializes request/response exchanges. The mutex is
 * reentrant so that a holder may connect, disconnect or issue a nested call.
 */
class Connection {
public:
    using ConnectListener = std::function<void()>;

    explicit Connection(TransportFactory factory);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// No-op when connected. Throws ConnectionError and stays disconnected on failure.
    void connect();

    /// Idempotent. Close errors are logged, never raised.
    void disconnect();

    bool is_connected();
    void ensure_connected();

    /// Drop the transport after a failed exchange.
    void mark_disconnected(const std::string& reason);

    /// Caller must hold exchange_mutex(). Throws ConnectionError when disconnected.
    Transport& transport();

    std::recursive_timed_mutex& exchange_mutex() { return exchange_mutex_; }

    /// Invoked after every successful connect, outside the exchange mutex.
    void set_connect_listener(ConnectListener listener);

private:
    void close_transport();

    TransportFactory factory_;
    std::recursive_timed_mutex exchange_mutex_;
    std::unique_ptr<Transport> transport_;
    ConnectionState state_ = ConnectionState::Disconnected;

    std::mutex listener_mutex_;
    ConnectListener on_connect_;
};

} // namespace bridge
