#include "retry_policy.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <optional>
#include <thread>

#include <log4cplus/loggingmacros.h>

namespace bridge {

RetryPolicy::RetryPolicy(Connection& connection, CallCorrelator& correlator, std::chrono::milliseconds delay)
    : connection_(connection), correlator_(correlator), delay_(delay) {}

Response RetryPolicy::call_with_retry(const std::string& method, const json& params, int max_retries) {
    std::optional<ConnectionError> last_error;

    for (int attempt = 0; attempt < max_retries; ++attempt) {
        try {
            LOG4CPLUS_DEBUG(client_logger(), "call_with_retry: attempt " << attempt + 1 << "/" << max_retries
                                                                         << " for " << method);
            return correlator_.call(method, params);
        } catch (const ConnectionError& exc) {
            last_error = exc;
            LOG4CPLUS_WARN(client_logger(), "call_with_retry: attempt " << attempt + 1 << "/" << max_retries
                                                                        << " failed: " << exc.what());
            if (attempt + 1 >= max_retries) {
                break;
            }

            std::this_thread::sleep_for(delay_);
            try {
                connection_.disconnect();
            } catch (const std::exception& disconnect_error) {
                LOG4CPLUS_DEBUG(client_logger(), "call_with_retry: disconnect failed (ignored): "
                                                     << disconnect_error.what());
            }
            try {
                connection_.connect();
            } catch (const ConnectionError& connect_error) {
                LOG4CPLUS_DEBUG(client_logger(), "call_with_retry: reconnect failed (will retry): "
                                                     << connect_error.what());
            }
        }
    }

    if (!last_error) {
        throw ConnectionError("Call failed with unknown error");
    }
    LOG4CPLUS_ERROR(client_logger(), "call_with_retry: giving up on " << method << " after " << max_retries
                                                                      << " attempts");
    throw *last_error;
}

} // namespace bridge
