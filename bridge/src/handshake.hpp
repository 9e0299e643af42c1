#pragma once

#include "protocol.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

/// Capability metadata returned by the game for the "handshake" method.
struct HandshakeInfo {
    std::string server_name = "Unknown";
    std::string version = "Unknown";
    std::vector<std::string> available_methods;
    int64_t total_methods = 0;
    std::optional<std::string> instructions;
    std::map<std::string, std::vector<std::string>> method_categories;
    json integrations;
};

/// Empty when the response carries an error or a non-object result.
std::optional<HandshakeInfo> parse_handshake(const Response& response);

} // namespace bridge
