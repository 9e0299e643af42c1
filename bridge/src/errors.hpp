#pragma once

#include <stdexcept>
#include <string>

namespace bridge {

/// Base of every failure raised by the connection and protocol engine.
class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& message) : std::runtime_error(message) {}
};

/// Socket-level failure: connect, read/write I/O, peer close, bad length prefix.
/// Always leaves the connection disconnected; the retry policy may retry it.
class ConnectionError : public BridgeError {
public:
    explicit ConnectionError(const std::string& message) : BridgeError(message) {}
};

/// Well-framed message with a malformed payload. Never retried.
class ProtocolError : public BridgeError {
public:
    explicit ProtocolError(const std::string& message) : BridgeError(message) {}
};

} // namespace bridge
