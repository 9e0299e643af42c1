#include "handshake.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace bridge {

namespace {

std::vector<std::string> string_list(const json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) {
        return out;
    }
    for (const auto& item : value) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

} // namespace

std::optional<HandshakeInfo> parse_handshake(const Response& response) {
    if (response.error) {
        LOG4CPLUS_WARN(core_logger(), "Handshake failed: " << response.error->message);
        return std::nullopt;
    }
    if (!response.result.is_object()) {
        LOG4CPLUS_WARN(core_logger(), "Handshake response format unexpected");
        return std::nullopt;
    }

    const json& data = response.result;
    HandshakeInfo info;
    if (auto name = codec::find_key(data, "server_name")) {
        info.server_name = codec::as_string(*name, info.server_name);
    }
    if (auto version = codec::find_key(data, "version")) {
        info.version = codec::as_string(*version, info.version);
    }
    if (auto methods = codec::find_key(data, "available_methods")) {
        info.available_methods = string_list(*methods);
    }
    info.total_methods = static_cast<int64_t>(info.available_methods.size());
    if (auto total = codec::find_key(data, "total_methods")) {
        info.total_methods = codec::as_int64(*total, info.total_methods);
    }
    if (auto instructions = codec::find_key(data, "instructions")) {
        if (instructions->is_string()) {
            info.instructions = instructions->get<std::string>();
        }
    }
    if (auto categories = codec::find_key(data, "method_categories")) {
        if (categories->is_object()) {
            for (auto it = categories->begin(); it != categories->end(); ++it) {
                info.method_categories[it.key()] = string_list(it.value());
            }
        }
    }
    if (auto integrations = codec::find_key(data, "integrations")) {
        info.integrations = *integrations;
    }
    return info;
}

} // namespace bridge
