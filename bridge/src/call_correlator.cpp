#include "call_correlator.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace bridge {

namespace {

// Restores the transport's send timeout when the acknowledgment write is done.
class SendTimeoutGuard {
public:
    SendTimeoutGuard(Transport& transport, std::chrono::milliseconds timeout)
        : transport_(transport), previous_(transport.send_timeout()) {
        transport_.set_send_timeout(timeout);
    }

    ~SendTimeoutGuard() {
        try {
            transport_.set_send_timeout(previous_);
        } catch (const std::exception& exc) {
            LOG4CPLUS_WARN(client_logger(), "Failed to restore send timeout: " << exc.what());
        }
    }

    SendTimeoutGuard(const SendTimeoutGuard&) = delete;
    SendTimeoutGuard& operator=(const SendTimeoutGuard&) = delete;

private:
    Transport& transport_;
    std::chrono::milliseconds previous_;
};

} // namespace

CallCorrelator::CallCorrelator(Connection& connection, CorrelatorOptions options)
    : connection_(connection), options_(options) {}

int64_t CallCorrelator::next_request_id() {
    std::lock_guard<std::mutex> lock(id_mutex_);
    return ++request_id_counter_;
}

int64_t CallCorrelator::last_request_id() const {
    std::lock_guard<std::mutex> lock(id_mutex_);
    return request_id_counter_;
}

Response CallCorrelator::call(const std::string& method, const json& params) {
    LOG4CPLUS_DEBUG(client_logger(), "call() invoked for method: " << method);
    connection_.ensure_connected();

    std::lock_guard<std::recursive_timed_mutex> lock(connection_.exchange_mutex());
    try {
        Transport& transport = connection_.transport();
        const int64_t request_id = next_request_id();
        return exchange(transport, request_id, method, params);
    } catch (const ConnectionError& exc) {
        LOG4CPLUS_ERROR(client_logger(), "Connection error during " << method << ": " << exc.what());
        connection_.mark_disconnected(exc.what());
        throw;
    } catch (const ProtocolError& exc) {
        LOG4CPLUS_ERROR(client_logger(), "Protocol error during " << method << ": " << exc.what());
        connection_.mark_disconnected(exc.what());
        throw;
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(client_logger(), "Unexpected error during " << method << ": " << exc.what());
        connection_.mark_disconnected(exc.what());
        throw ConnectionError(std::string("Unexpected error during call: ") + exc.what());
    }
}

Response CallCorrelator::exchange(Transport& transport, int64_t request_id, const std::string& method,
                                  const json& params) {
    Request request;
    request.id = request_id;
    request.method = method;
    request.params = params;

    LOG4CPLUS_DEBUG(client_logger(), "Sending request: " << method << " (ID: " << request_id << ")");
    transport.write_message(codec::encode_request(request));

    Response response = codec::decode_response(transport.read_message());
    if (response.id != request_id) {
        if (codec::is_server_heartbeat(response)) {
            LOG4CPLUS_DEBUG(client_logger(), "Received server heartbeat (ID: " << response.id
                                                 << "), waiting for response to request " << request_id);
            response = codec::decode_response(transport.read_message());
            if (response.id != request_id) {
                report_id_mismatch(request_id, response.id, "after server heartbeat");
            }
        } else {
            report_id_mismatch(request_id, response.id, "");
        }
    }

    if (response.error) {
        LOG4CPLUS_DEBUG(client_logger(), "Response " << response.id << " carries error: code="
                                                      << response.error->code << ", message=" << response.error->message);
    }

    send_acknowledgment(transport, response.id);
    return response;
}

void CallCorrelator::report_id_mismatch(int64_t expected, int64_t actual, const char* context) const {
    std::string message = "Response ID mismatch";
    if (context && *context) {
        message += " ";
        message += context;
    }
    message += ": expected " + std::to_string(expected) + ", got " + std::to_string(actual);

    if (options_.strict_id_check) {
        throw ProtocolError(message);
    }
    LOG4CPLUS_WARN(client_logger(), message);
}

void CallCorrelator::send_acknowledgment(Transport& transport, int64_t response_id) {
    try {
        SendTimeoutGuard timeout_guard(transport, options_.ack_timeout);
        Acknowledgment ack;
        ack.id = response_id;
        transport.write_message(codec::encode_acknowledgment(ack));
        LOG4CPLUS_DEBUG(client_logger(), "Acknowledgment sent for ID: " << response_id);
    } catch (const std::exception& exc) {
        LOG4CPLUS_WARN(client_logger(), "Failed to send acknowledgment for ID " << response_id << ": " << exc.what());
    }
}

} // namespace bridge
