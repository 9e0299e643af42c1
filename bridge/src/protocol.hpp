#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace bridge {

using json = nlohmann::json;

constexpr std::size_t kLengthPrefixSize = 4;
constexpr std::uint32_t kMaxMessageSize = 10 * 1024 * 1024;

constexpr const char* kHandshakeMethod = "handshake";
constexpr const char* kHeartbeatMethod = "heartbeat";
constexpr const char* kServerHeartbeatType = "server_heartbeat";
constexpr const char* kAckStatusReceived = "received";

// JSON-RPC error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kApplicationErrorFirst = -32099;
constexpr int kApplicationErrorLast = -32000;

struct ErrorInfo {
    int32_t code = kInternalError;
    std::string message;
    std::optional<json> data; // object when present
};

struct Request {
    int64_t id = 0;
    std::string method;
    json params = json::object();
};

struct Response {
    int64_t id = 0;
    json result;                  // null when absent
    std::optional<ErrorInfo> error;

    bool has_error() const { return error.has_value(); }
};

struct Acknowledgment {
    int64_t id = 0;
    std::string status = kAckStatusReceived;
};

enum class ConnectionState {
    Disconnected,
    Connected,
};

} // namespace bridge
