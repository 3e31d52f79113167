/**
 * Resilient connection tests.
 * Asserts:
 * - Open services return on the fast path without a connect call.
 * - 5 failures then a success take 6 attempts with delays 0.5, 1, 2, 4, 8.
 * - Jitter is added on top of the doubling delay, never instead of it.
 * - Attempts never exceed max_attempts; exhausting them raises ConnectionError.
 * - A connect that returns without reaching Open counts as a failure.
 * - Concurrent callers are serialized and connect only once.
 * - cancel() aborts a pending backoff sleep.
 * - Each reconnect keeps a delay record of its own.
 *
 * Run from build dir: ./test_resilient_connection
 */

#include "errors.h"
#include "net/resilient_connection.h"
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace parley;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

/// Fails the first `failures` connects, then opens
class FlakyService : public Connectable {
public:
    explicit FlakyService(int failures, bool silent_failure = false)
        : failures_(failures), silent_failure_(silent_failure) {}

    ConnectionState connection_state() const override { return state_.load(); }

    void connect() override {
        int n = ++connects_;
        if (hold_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(hold_ms_));
        }
        if (n <= failures_) {
            if (silent_failure_) {
                state_ = ConnectionState::Failed;
                return;
            }
            throw ConnectionError("HTTP 429 Too Many Requests");
        }
        state_ = ConnectionState::Open;
    }

    std::string connection_name() const override { return "flaky"; }

    int connects() const { return connects_.load(); }
    void set_hold_ms(int ms) { hold_ms_ = ms; }
    void drop() { state_ = ConnectionState::Idle; }

private:
    int failures_;
    bool silent_failure_;
    int hold_ms_ = 0;
    std::atomic<int> connects_{0};
    std::atomic<ConnectionState> state_{ConnectionState::Idle};
};

ResilientConnection::Sleeper no_sleep(std::vector<double>* log) {
    return [log](double seconds) {
        if (log) log->push_back(seconds);
        return true;
    };
}

ResilientConnection::JitterSource no_jitter() {
    return [](double) { return 0.0; };
}

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

} // namespace

int main() {
    BackoffPolicy policy;
    policy.initial_s = 0.5;
    policy.max_s = 8.0;
    policy.max_attempts = 6;

    // --- schedule before jitter ---
    {
        std::vector<double> expected = {0.5, 1.0, 2.0, 4.0, 8.0, 8.0};
        std::vector<double> schedule = policy.schedule();
        ASSERT(schedule.size() == expected.size());
        for (size_t i = 0; i < expected.size() && i < schedule.size(); ++i) {
            ASSERT(near(schedule[i], expected[i]));
        }
    }

    // --- normalization ---
    {
        BackoffPolicy odd;
        odd.initial_s = 0.0;
        odd.max_s = 0.01;
        odd.max_attempts = 0;
        BackoffPolicy n = odd.normalized();
        ASSERT(n.initial_s >= 0.1);
        ASSERT(n.max_s >= n.initial_s);
        ASSERT(n.max_attempts == 1);
    }

    // --- fast path ---
    {
        FlakyService service(0);
        service.connect();
        ASSERT(service.connects() == 1);
        ResilientConnection conn(service, policy, no_sleep(nullptr), no_jitter());
        conn.ensure_connected();
        ASSERT(service.connects() == 1);
        ASSERT(conn.total_attempts() == 0);
    }

    // --- 5 failures then success ---
    {
        FlakyService service(5);
        std::vector<double> slept;
        ResilientConnection conn(service, policy, no_sleep(&slept), no_jitter());
        conn.ensure_connected();
        ASSERT(service.connection_state() == ConnectionState::Open);
        ASSERT(conn.total_attempts() == 6);
        std::vector<double> expected = {0.5, 1.0, 2.0, 4.0, 8.0};
        ASSERT(slept.size() == expected.size());
        for (size_t i = 0; i < expected.size() && i < slept.size(); ++i) {
            ASSERT(near(slept[i], expected[i]));
        }
        ASSERT(conn.slept_delays() == slept);
    }

    // --- each reconnect starts a fresh delay record ---
    {
        FlakyService service(2);
        ResilientConnection conn(service, policy, no_sleep(nullptr), no_jitter());
        conn.ensure_connected();
        ASSERT(conn.slept_delays().size() == 2);

        service.drop();
        conn.ensure_connected();
        ASSERT(service.connection_state() == ConnectionState::Open);
        ASSERT(conn.total_attempts() == 4);
        ASSERT(conn.slept_delays().empty());
    }

    // --- jitter lands in [delay, delay * 1.5] ---
    {
        FlakyService service(3);
        ResilientConnection conn(service, policy, no_sleep(nullptr),
                                 [](double delay) { return delay * 0.5; });
        conn.ensure_connected();
        std::vector<double> slept = conn.slept_delays();
        ASSERT(slept.size() == 3);
        if (slept.size() == 3) {
            ASSERT(near(slept[0], 0.75));
            ASSERT(near(slept[1], 1.5));
            ASSERT(near(slept[2], 3.0));
        }
    }
    {
        // Jitter stays inside the bound
        BackoffPolicy quick;
        quick.initial_s = 0.1;
        quick.max_s = 0.1;
        quick.max_attempts = 3;
        FlakyService service(2);
        std::vector<double> slept;
        ResilientConnection conn(service, quick, no_sleep(&slept),
                                 [](double delay) { return delay * 0.25; });
        conn.ensure_connected();
        for (double s : slept) {
            ASSERT(s >= 0.1 && s <= 0.15 + 1e-9);
        }
    }

    // --- exhaustion ---
    {
        FlakyService service(100);
        std::vector<double> slept;
        ResilientConnection conn(service, policy, no_sleep(&slept), no_jitter());
        bool threw = false;
        try {
            conn.ensure_connected();
        } catch (const ConnectionError& e) {
            threw = true;
            ASSERT(std::string(e.what()).find("429") != std::string::npos);
        }
        ASSERT(threw);
        ASSERT(service.connects() == 6);
        ASSERT(conn.total_attempts() == 6);
        ASSERT(slept.size() == 5);
    }

    // --- connect returned but state is not Open ---
    {
        FlakyService service(2, true);
        ResilientConnection conn(service, policy, no_sleep(nullptr), no_jitter());
        conn.ensure_connected();
        ASSERT(conn.total_attempts() == 3);
        ASSERT(service.connection_state() == ConnectionState::Open);
    }

    // --- serialized callers ---
    {
        FlakyService service(0);
        service.set_hold_ms(50);
        ResilientConnection conn(service, policy, no_sleep(nullptr), no_jitter());
        std::vector<std::thread> callers;
        std::atomic<int> errors{0};
        for (int i = 0; i < 8; ++i) {
            callers.emplace_back([&] {
                try {
                    conn.ensure_connected();
                } catch (const ConnectionError&) {
                    errors++;
                }
            });
        }
        for (auto& t : callers) t.join();
        ASSERT(errors == 0);
        ASSERT(service.connects() == 1);

        // Reconnect after a drop
        service.set_hold_ms(0);
        service.drop();
        conn.ensure_connected();
        ASSERT(service.connects() == 2);
    }

    // --- cancel interrupts the backoff sleep ---
    {
        BackoffPolicy slow;
        slow.initial_s = 5.0;
        slow.max_s = 5.0;
        slow.max_attempts = 3;
        FlakyService service(100);
        ResilientConnection conn(service, slow);

        auto started = std::chrono::steady_clock::now();
        std::thread canceller([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            conn.cancel();
        });
        bool threw = false;
        try {
            conn.ensure_connected();
        } catch (const ConnectionError&) {
            threw = true;
        }
        canceller.join();
        auto elapsed = std::chrono::steady_clock::now() - started;
        ASSERT(threw);
        ASSERT(elapsed < std::chrono::seconds(3));
        ASSERT(service.connects() == 1);

        threw = false;
        try {
            conn.ensure_connected();
        } catch (const ConnectionError&) {
            threw = true;
        }
        ASSERT(threw);
        ASSERT(service.connects() == 1);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All resilient connection tests passed.\n";
    return 0;
}
