/**
 * @file resilient_connection.cpp
 * @brief Backoff-and-retry connect discipline for streaming services
 */

#include "net/resilient_connection.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <chrono>
#include <random>
#include <sstream>

namespace parley {

BackoffPolicy BackoffPolicy::normalized() const {
    BackoffPolicy p = *this;
    p.initial_s = std::max(p.initial_s, constants::backoff::MIN_INITIAL_S);
    p.max_s = std::max(p.max_s, p.initial_s);
    p.max_attempts = std::max(p.max_attempts, 1);
    return p;
}

std::vector<double> BackoffPolicy::schedule() const {
    BackoffPolicy p = normalized();
    std::vector<double> delays;
    delays.reserve(static_cast<size_t>(p.max_attempts));
    double delay = p.initial_s;
    for (int i = 0; i < p.max_attempts; ++i) {
        delays.push_back(delay);
        delay = std::min(delay * 2.0, p.max_s);
    }
    return delays;
}

namespace {

double uniform_jitter(double delay) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, delay * constants::backoff::JITTER_FRACTION);
    return dist(rng);
}

} // anonymous namespace

ResilientConnection::ResilientConnection(Connectable& service, BackoffPolicy policy)
    : service_(service), policy_(policy.normalized()) {
    sleeper_ = [this](double seconds) { return interruptible_sleep(seconds); };
    jitter_ = uniform_jitter;
}

ResilientConnection::ResilientConnection(Connectable& service, BackoffPolicy policy,
                                         Sleeper sleeper, JitterSource jitter)
    : service_(service), policy_(policy.normalized()),
      sleeper_(std::move(sleeper)), jitter_(std::move(jitter)) {}

bool ResilientConnection::interruptible_sleep(double seconds) {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    auto duration = std::chrono::duration<double>(seconds);
    return !sleep_cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

void ResilientConnection::cancel() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lock(sleep_mutex_);
    sleep_cv_.notify_all();
}

std::vector<double> ResilientConnection::slept_delays() const {
    std::lock_guard<std::mutex> lock(sleep_mutex_);
    return slept_delays_;
}

void ResilientConnection::ensure_connected() {
    // Fast path: no lock while the connection is healthy
    if (service_.connection_state() == ConnectionState::Open) {
        return;
    }

    std::lock_guard<std::mutex> lock(connect_mutex_);
    const std::string name = service_.connection_name();

    // Another caller may have connected while we waited for the lock
    if (service_.connection_state() == ConnectionState::Open) {
        return;
    }

    {
        std::lock_guard<std::mutex> sleep_lock(sleep_mutex_);
        slept_delays_.clear();
    }

    double delay = policy_.initial_s;
    std::string last_error = "not attempted";

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        if (cancelled_) {
            throw ConnectionError(name + ": connect cancelled");
        }

        total_attempts_++;
        try {
            service_.connect();
            ConnectionState state = service_.connection_state();
            if (state == ConnectionState::Open) {
                if (attempt > 1) {
                    LOG_CONN(name + " connected after " + std::to_string(attempt) + " attempts");
                }
                return;
            }
            last_error = std::string("connection not open after connect (state=") +
                         connection_state_name(state) + ")";
        } catch (const std::exception& e) {
            last_error = e.what();
        }

        if (attempt == policy_.max_attempts) {
            break;
        }

        double sleep_s = delay + jitter_(delay);
        std::ostringstream oss;
        oss << name << " connect attempt " << attempt << "/" << policy_.max_attempts
            << " failed: " << last_error << "; retrying in " << sleep_s << "s";
        LOG_WARN(oss.str());

        {
            std::lock_guard<std::mutex> sleep_lock(sleep_mutex_);
            slept_delays_.push_back(sleep_s);
        }
        if (!sleeper_(sleep_s)) {
            throw ConnectionError(name + ": connect cancelled");
        }
        delay = std::min(delay * 2.0, policy_.max_s);
    }

    std::ostringstream oss;
    oss << name << " failed to connect after " << policy_.max_attempts
        << " attempts: " << last_error;
    LOG_ERROR(oss.str());
    throw ConnectionError(oss.str());
}

} // namespace parley
