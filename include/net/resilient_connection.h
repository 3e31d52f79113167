#pragma once

/**
 * @file resilient_connection.h
 * @brief Serialized reconnect with exponential backoff and jitter
 */

#include "net/connection.h"
#include "core/constants.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace parley {

/**
 * @brief Backoff parameters
 */
struct BackoffPolicy {
    double initial_s = constants::backoff::INITIAL_S;
    double max_s = constants::backoff::MAX_S;
    int max_attempts = constants::backoff::MAX_ATTEMPTS;

    /// Clamp to sane values: initial >= 0.1s, max >= initial, attempts >= 1
    BackoffPolicy normalized() const;

    /// Delay (before jitter) after each failed attempt: initial, 2x, 4x ... capped at max
    std::vector<double> schedule() const;
};

/**
 * @brief Guards connection attempts to one streaming dependency
 *
 * ensure_connected() returns immediately while the service reports Open.
 * Otherwise callers are serialized on one lock; the first re-checks the
 * state, then connects, sleeping delay + uniform(0, delay/2) between
 * failed attempts. Exhausting the attempts raises ConnectionError.
 *
 * One instance per connection owner; never shared across sessions.
 */
class ResilientConnection {
public:
    /// Sleep for the given seconds; returns false if interrupted by cancel()
    using Sleeper = std::function<bool(double seconds)>;
    /// Jitter for a given delay, in [0, delay * 0.5]
    using JitterSource = std::function<double(double delay)>;

    ResilientConnection(Connectable& service, BackoffPolicy policy);

    /// Inject sleeping and jitter (tests)
    ResilientConnection(Connectable& service, BackoffPolicy policy,
                        Sleeper sleeper, JitterSource jitter);

    // Non-copyable
    ResilientConnection(const ResilientConnection&) = delete;
    ResilientConnection& operator=(const ResilientConnection&) = delete;

    /**
     * @brief Make sure the service is connected
     * @throws ConnectionError once max_attempts connects have failed, or when cancelled
     */
    void ensure_connected();

    /// Abort a pending backoff sleep; later calls fail fast
    void cancel();

    const BackoffPolicy& policy() const { return policy_; }

    /// Connect calls made over this wrapper's lifetime
    int total_attempts() const { return total_attempts_.load(); }

    /// Delays slept (including jitter) by the latest reconnect, in order
    std::vector<double> slept_delays() const;

private:
    bool interruptible_sleep(double seconds);

    Connectable& service_;
    BackoffPolicy policy_;
    Sleeper sleeper_;
    JitterSource jitter_;

    std::mutex connect_mutex_;
    std::atomic<int> total_attempts_{0};
    std::atomic<bool> cancelled_{false};

    mutable std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;
    std::vector<double> slept_delays_;
};

} // namespace parley
