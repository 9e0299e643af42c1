#include "connection.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace bridge {

Connection::Connection(TransportFactory factory) : factory_(std::move(factory)) {}

Connection::~Connection() {
    std::lock_guard<std::recursive_timed_mutex> lock(exchange_mutex_);
    close_transport();
}

void Connection::connect() {
    {
        std::lock_guard<std::recursive_timed_mutex> lock(exchange_mutex_);
        if (state_ == ConnectionState::Connected) {
            LOG4CPLUS_DEBUG(client_logger(), "Already connected");
            return;
        }

        if (!factory_) {
            throw ConnectionError("No transport factory configured");
        }

        try {
            std::unique_ptr<Transport> transport = factory_();
            if (!transport) {
                throw ConnectionError("Transport factory returned no transport");
            }
            transport_ = std::move(transport);
        } catch (const ConnectionError& exc) {
            transport_.reset();
            state_ = ConnectionState::Disconnected;
            LOG4CPLUS_ERROR(client_logger(), "Failed to connect: " << exc.what());
            throw;
        } catch (const std::exception& exc) {
            transport_.reset();
            state_ = ConnectionState::Disconnected;
            LOG4CPLUS_ERROR(client_logger(), "Unexpected error while connecting: " << exc.what());
            throw ConnectionError(std::string("Unexpected error connecting: ") + exc.what());
        }

        state_ = ConnectionState::Connected;
        LOG4CPLUS_INFO(client_logger(), "Connected to game");
    }

    ConnectListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = on_connect_;
    }
    if (listener) {
        try {
            listener();
        } catch (const std::exception& exc) {
            LOG4CPLUS_WARN(client_logger(), "Connect listener failed: " << exc.what());
        }
    }
}

void Connection::disconnect() {
    std::lock_guard<std::recursive_timed_mutex> lock(exchange_mutex_);
    if (!transport_) {
        state_ = ConnectionState::Disconnected;
        LOG4CPLUS_DEBUG(client_logger(), "Disconnect called but no transport is open");
        return;
    }

    close_transport();
    LOG4CPLUS_INFO(client_logger(), "Disconnected from game");
}

bool Connection::is_connected() {
    std::lock_guard<std::recursive_timed_mutex> lock(exchange_mutex_);
    return state_ == ConnectionState::Connected && transport_ != nullptr;
}

void Connection::ensure_connected() {
    if (!is_connected()) {
        LOG4CPLUS_DEBUG(client_logger(), "Not connected, attempting to connect");
        connect();
    }
}

void Connection::mark_disconnected(const std::string& reason) {
    std::lock_guard<std::recursive_timed_mutex> lock(exchange_mutex_);
    if (state_ == ConnectionState::Connected) {
        LOG4CPLUS_WARN(client_logger(), "Connection marked dead: " << reason);
    }
    close_transport();
}

Transport& Connection::transport() {
    std::lock_guard<std::recursive_timed_mutex> lock(exchange_mutex_);
    if (state_ != ConnectionState::Connected || !transport_) {
        throw ConnectionError("Not connected");
    }
    return *transport_;
}

void Connection::set_connect_listener(ConnectListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    on_connect_ = std::move(listener);
}

void Connection::close_transport() {
    if (transport_) {
        try {
            transport_->close();
        } catch (const std::exception& exc) {
            LOG4CPLUS_WARN(client_logger(), "Error closing transport: " << exc.what());
        }
        transport_.reset();
    }
    state_ = ConnectionState::Disconnected;
}

} // namespace bridge
