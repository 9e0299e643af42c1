#pragma once

#include "connection.hpp"
#include "retry_policy.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace bridge {

struct HeartbeatOptions {
    std::chrono::milliseconds interval{60000};
    std::chrono::milliseconds join_timeout{2000};
    // How long a tick waits for an in-flight exchange before skipping.
    std::chrono::milliseconds lock_wait{1000};
    int max_retries = 1;
};

/**
 * Background loop that sends "heartbeat" on a fixed interval.
 *
 * Ticks are skipped while disconnected or while an application call holds
 * the exchange. Failures are logged and never end the loop; only stop() does.
 */
class HeartbeatDaemon {
public:
    HeartbeatDaemon(Connection& connection, RetryPolicy& retry, HeartbeatOptions options = {});
    ~HeartbeatDaemon();

    HeartbeatDaemon(const HeartbeatDaemon&) = delete;
    HeartbeatDaemon& operator=(const HeartbeatDaemon&) = delete;

    /// Idempotent; also safe to call from the heartbeat thread itself.
    void start();

    /// Signal the loop and wait at most join_timeout for it to finish.
    void stop();

    bool is_running() const;

    uint64_t beats_sent() const { return beats_sent_.load(); }
    uint64_t beats_failed() const { return beats_failed_.load(); }
    uint64_t ticks_skipped() const { return ticks_skipped_.load(); }

private:
    void run();
    void tick();

    Connection& connection_;
    RetryPolicy& retry_;
    HeartbeatOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool loop_finished_ = true;
    std::thread thread_;

    std::atomic<uint64_t> beats_sent_{0};
    std::atomic<uint64_t> beats_failed_{0};
    std::atomic<uint64_t> ticks_skipped_{0};
};

} // namespace bridge
