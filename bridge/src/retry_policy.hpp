#pragma once

#include "call_correlator.hpp"
#include "connection.hpp"
#include "protocol.hpp"

#include <chrono>
#include <string>

namespace bridge {

/// Bounded retry of a single logical call, reconnecting between attempts.
class RetryPolicy {
public:
    RetryPolicy(Connection& connection, CallCorrelator& correlator, std::chrono::milliseconds delay);

    /**
     * Attempt the call up to `max_retries` times. Connection errors trigger a
     * delay, a disconnect and a reconnect before the next attempt; protocol
     * errors propagate at once. Throws the last ConnectionError when every
     * attempt failed.
     */
    Response call_with_retry(const std::string& method, const json& params, int max_retries);

private:
    Connection& connection_;
    CallCorrelator& correlator_;
    std::chrono::milliseconds delay_;
};

} // namespace bridge
