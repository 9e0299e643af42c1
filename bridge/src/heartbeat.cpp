#include "heartbeat.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace bridge {

HeartbeatDaemon::HeartbeatDaemon(Connection& connection, RetryPolicy& retry, HeartbeatOptions options)
    : connection_(connection), retry_(retry), options_(options) {}

HeartbeatDaemon::~HeartbeatDaemon() {
    stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void HeartbeatDaemon::start() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            return;
        }
        if (!stop_requested_ && !loop_finished_) {
            LOG4CPLUS_DEBUG(client_logger(), "Heartbeat thread already running");
            return;
        }

        // A previous loop was stopped but may still be finishing its last tick.
        std::thread previous = std::move(thread_);
        lock.unlock();
        previous.join();
        lock.lock();
        if (thread_.joinable()) {
            return;
        }
    }

    stop_requested_ = false;
    loop_finished_ = false;
    thread_ = std::thread(&HeartbeatDaemon::run, this);
    LOG4CPLUS_DEBUG(client_logger(), "Heartbeat thread started");
}

void HeartbeatDaemon::stop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!thread_.joinable()) {
        return;
    }

    stop_requested_ = true;
    cv_.notify_all();
    if (thread_.get_id() == std::this_thread::get_id()) {
        return;
    }

    if (!cv_.wait_for(lock, options_.join_timeout, [this] { return loop_finished_; })) {
        LOG4CPLUS_WARN(client_logger(), "Heartbeat thread did not stop within "
                                            << options_.join_timeout.count() << " ms, continuing");
        return;
    }

    std::thread finished = std::move(thread_);
    lock.unlock();
    finished.join();
    LOG4CPLUS_DEBUG(client_logger(), "Heartbeat thread stopped");
}

bool HeartbeatDaemon::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable() && !loop_finished_ && !stop_requested_;
}

void HeartbeatDaemon::run() {
    LOG4CPLUS_DEBUG(client_logger(), "Heartbeat loop started (interval: " << options_.interval.count() << " ms)");

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, options_.interval, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        tick();
        lock.lock();
    }

    loop_finished_ = true;
    cv_.notify_all();
    LOG4CPLUS_DEBUG(client_logger(), "Heartbeat loop ended");
}

void HeartbeatDaemon::tick() {
    try {
        std::unique_lock<std::recursive_timed_mutex> exchange(connection_.exchange_mutex(), std::defer_lock);
        if (!exchange.try_lock_for(options_.lock_wait)) {
            ++ticks_skipped_;
            LOG4CPLUS_DEBUG(client_logger(), "Heartbeat: exchange in progress, skipping");
            return;
        }

        if (!connection_.is_connected()) {
            ++ticks_skipped_;
            LOG4CPLUS_DEBUG(client_logger(), "Heartbeat: not connected, skipping");
            return;
        }

        Response response = retry_.call_with_retry(kHeartbeatMethod, json::object(), options_.max_retries);
        ++beats_sent_;
        if (response.error) {
            LOG4CPLUS_DEBUG(client_logger(), "Heartbeat answered with error: " << response.error->message);
        } else {
            LOG4CPLUS_DEBUG(client_logger(), "Heartbeat sent successfully");
        }
    } catch (const ConnectionError& exc) {
        ++beats_failed_;
        LOG4CPLUS_DEBUG(client_logger(), "Heartbeat connection error (will retry next interval): " << exc.what());
    } catch (const std::exception& exc) {
        ++beats_failed_;
        LOG4CPLUS_DEBUG(client_logger(), "Error sending heartbeat (will retry next interval): " << exc.what());
    }
}

} // namespace bridge
