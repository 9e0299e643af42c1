#pragma once

#include "protocol.hpp"

#include <cstdint>
#include <string>

namespace bridge::codec {

/// Prepend the 4-byte little-endian length prefix to a JSON payload.
/// Throws ProtocolError when the payload is empty or larger than kMaxMessageSize.
std::string frame_payload(const std::string& payload);

uint32_t read_length_prefix(const char* data);
void write_length_prefix(uint32_t length, char* out);

std::string encode_request(int64_t id, const std::string& method, const json& params);
std::string encode_request(const Request& request);

/**
 * Decode a complete frame (length prefix + JSON payload) into a Response.
 *
 * Throws ProtocolError on a short buffer, a zero or oversized prefix, invalid
 * JSON, or a payload lacking an integer "id".
 */
Response decode_response(const std::string& bytes);

std::string encode_acknowledgment(const Acknowledgment& ack);
std::string encode_acknowledgment(int64_t id);

/// Framed Response, the shape the game side sends.
std::string encode_response(const Response& response);
json response_to_json(const Response& response);

/// Keep standard JSON-RPC codes and the application band, anything else becomes kInternalError.
int normalize_error_code(int code);

bool is_server_heartbeat(const Response& response);

const json* find_key(const json& object, const std::string& key);
std::string as_string(const json& value, const std::string& fallback = "");
int64_t as_int64(const json& value, int64_t fallback = 0);

} // namespace bridge::codec
