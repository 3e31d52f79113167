#pragma once

#include <string>

namespace parley {

/**
 * @brief Connection lifecycle of a streaming dependency
 */
enum class ConnectionState {
    Idle,
    Connecting,
    Open,
    Failed
};

const char* connection_state_name(ConnectionState state);

/**
 * @brief A streaming service that can be (re)connected
 *
 * connection_state() is the check the resilient wrapper uses for its
 * lock-free fast path, so it must be cheap and thread-safe.
 */
class Connectable {
public:
    virtual ~Connectable() = default;

    virtual ConnectionState connection_state() const = 0;

    /**
     * @brief Attempt one connection
     * @throws ConnectionError (or any exception) on failure
     */
    virtual void connect() = 0;

    virtual std::string connection_name() const = 0;
};

inline const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle: return "idle";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Open: return "open";
        case ConnectionState::Failed: return "failed";
    }
    return "unknown";
}

} // namespace parley
