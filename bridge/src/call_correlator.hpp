#pragma once

#include "connection.hpp"
#include "protocol.hpp"

#include <chrono>
#include <mutex>
#include <string>

namespace bridge {

struct CorrelatorOptions {
    std::chrono::milliseconds ack_timeout{5000};
    // Raise ProtocolError instead of warning when a response id cannot be matched.
    bool strict_id_check = false;
};

/**
 * Drives one request/response/acknowledgment exchange at a time over a
 * Connection and matches responses to requests by id.
 *
 * Safe to call from several threads; callers queue on the connection's
 * exchange mutex. Request ids come from a counter with its own mutex so that
 * allocating one never waits on network I/O.
 */
class CallCorrelator {
public:
    explicit CallCorrelator(Connection& connection, CorrelatorOptions options = {});

    /**
     * Send `method` with `params` and return the matching response.
     *
     * Throws ConnectionError for transport failures and ProtocolError for
     * malformed responses; both leave the connection disconnected. An
     * application error is returned inside the Response.
     */
    Response call(const std::string& method, const json& params = json::object());

    int64_t next_request_id();
    int64_t last_request_id() const;

private:
    Response exchange(Transport& transport, int64_t request_id, const std::string& method, const json& params);
    void report_id_mismatch(int64_t expected, int64_t actual, const char* context) const;
    void send_acknowledgment(Transport& transport, int64_t response_id);

    Connection& connection_;
    CorrelatorOptions options_;

    mutable std::mutex id_mutex_;
    int64_t request_id_counter_ = 0;
};

} // namespace bridge
