#include "json_codec.hpp"

#include "errors.hpp"

#include <cstdint>
#include <limits>

namespace bridge::codec {

namespace {

// Rejects unsigned values that would wrap when read as int64_t.
bool fits_int64(const json& value) {
    return !value.is_number_unsigned() ||
           value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
}

std::string dump_compact(const json& value) {
    try {
        return value.dump();
    } catch (const json::type_error& exc) {
        throw ProtocolError(std::string("Cannot serialize message: ") + exc.what());
    }
}

ErrorInfo decode_error(const json& error_obj) {
    ErrorInfo error;
    error.message = "Internal error";

    if (auto code = find_key(error_obj, "code")) {
        if (!code->is_number_integer()) {
            throw ProtocolError("Invalid response structure: error.code must be an integer");
        }
        const int64_t value = fits_int64(*code) ? code->get<int64_t>() : std::numeric_limits<int64_t>::max();
        if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
            throw ProtocolError("Invalid response structure: error.code out of range");
        }
        error.code = static_cast<int32_t>(value);
    }
    if (auto message = find_key(error_obj, "message")) {
        if (!message->is_string()) {
            throw ProtocolError("Invalid response structure: error.message must be a string");
        }
        error.message = message->get<std::string>();
    }
    if (auto data = find_key(error_obj, "data")) {
        if (data->is_object()) {
            error.data = *data;
        }
    }
    return error;
}

} // namespace

uint32_t read_length_prefix(const char* data) {
    const auto* b = reinterpret_cast<const unsigned char*>(data);
    return static_cast<uint32_t>(b[0]) |
           (static_cast<uint32_t>(b[1]) << 8) |
           (static_cast<uint32_t>(b[2]) << 16) |
           (static_cast<uint32_t>(b[3]) << 24);
}

void write_length_prefix(uint32_t length, char* out) {
    out[0] = static_cast<char>(length & 0xFF);
    out[1] = static_cast<char>((length >> 8) & 0xFF);
    out[2] = static_cast<char>((length >> 16) & 0xFF);
    out[3] = static_cast<char>((length >> 24) & 0xFF);
}

std::string frame_payload(const std::string& payload) {
    if (payload.empty()) {
        throw ProtocolError("Refusing to frame an empty message");
    }
    if (payload.size() > kMaxMessageSize) {
        throw ProtocolError("Message too large: " + std::to_string(payload.size()) + " bytes");
    }

    std::string frame(kLengthPrefixSize + payload.size(), '\0');
    write_length_prefix(static_cast<uint32_t>(payload.size()), frame.data());
    frame.replace(kLengthPrefixSize, payload.size(), payload);
    return frame;
}

std::string encode_request(int64_t id, const std::string& method, const json& params) {
    json message = {
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? json::object() : params},
    };
    return frame_payload(dump_compact(message));
}

std::string encode_request(const Request& request) {
    return encode_request(request.id, request.method, request.params);
}

Response decode_response(const std::string& bytes) {
    if (bytes.size() < kLengthPrefixSize) {
        throw ProtocolError("Message too short: missing length prefix (got " +
                            std::to_string(bytes.size()) + " bytes)");
    }

    const uint32_t length = read_length_prefix(bytes.data());
    if (length == 0 || length > kMaxMessageSize) {
        throw ProtocolError("Invalid message length: " + std::to_string(length));
    }
    if (bytes.size() < kLengthPrefixSize + length) {
        throw ProtocolError("Message incomplete: expected " + std::to_string(kLengthPrefixSize + length) +
                            " bytes, got " + std::to_string(bytes.size()));
    }

    json root;
    try {
        root = json::parse(bytes.begin() + kLengthPrefixSize, bytes.begin() + kLengthPrefixSize + length);
    } catch (const json::parse_error& exc) {
        throw ProtocolError(std::string("Invalid JSON: ") + exc.what());
    }

    if (!root.is_object()) {
        throw ProtocolError("Invalid response structure: payload is not an object");
    }

    const json* id = find_key(root, "id");
    if (!id || !id->is_number_integer()) {
        throw ProtocolError("Invalid response structure: missing integer id");
    }
    if (!fits_int64(*id)) {
        throw ProtocolError("Invalid response structure: id out of range");
    }

    Response response;
    response.id = id->get<int64_t>();
    if (auto result = find_key(root, "result")) {
        response.result = *result;
    }
    if (auto error = find_key(root, "error")) {
        if (error->is_object()) {
            if (!error->empty()) {
                response.error = decode_error(*error);
            }
        } else if (!error->is_null()) {
            throw ProtocolError("Invalid response structure: error must be an object or null");
        }
    }
    return response;
}

std::string encode_acknowledgment(const Acknowledgment& ack) {
    json message = {
        {"id", ack.id},
        {"status", ack.status},
    };
    return frame_payload(dump_compact(message));
}

std::string encode_acknowledgment(int64_t id) {
    Acknowledgment ack;
    ack.id = id;
    return encode_acknowledgment(ack);
}

json response_to_json(const Response& response) {
    json error = nullptr;
    if (response.error) {
        error = {
            {"code", response.error->code},
            {"message", response.error->message},
            {"data", response.error->data ? *response.error->data : json(nullptr)},
        };
    }
    return {
        {"id", response.id},
        {"result", response.result},
        {"error", error},
    };
}

std::string encode_response(const Response& response) {
    return frame_payload(dump_compact(response_to_json(response)));
}

int normalize_error_code(int code) {
    switch (code) {
    case kParseError:
    case kInvalidRequest:
    case kMethodNotFound:
    case kInvalidParams:
    case kInternalError:
        return code;
    default:
        break;
    }

    if (code >= kApplicationErrorFirst && code <= kApplicationErrorLast) {
        return code;
    }
    return kInternalError;
}

bool is_server_heartbeat(const Response& response) {
    if (!response.result.is_object()) {
        return false;
    }
    if (auto type = find_key(response.result, "type")) {
        return as_string(*type) == kServerHeartbeatType;
    }
    return false;
}

const json* find_key(const json& object, const std::string& key) {
    if (!object.is_object()) {
        return nullptr;
    }

    auto it = object.find(key);
    if (it == object.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const json& value, const std::string& fallback) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const json& value, int64_t fallback) {
    if (value.is_number_integer() && fits_int64(value)) {
        return value.get<int64_t>();
    }
    return fallback;
}

} // namespace bridge::codec
