#pragma once

/**
 * @file websocket_client.h
 * @brief Blocking TLS WebSocket client (Boost.Beast)
 *
 * One thread reads while any thread may send; sends are serialized
 * internally.
 */

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace parley {

struct WebSocketEndpoint {
    std::string host;
    std::string port = "443";
    std::string path = "/";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string user_agent = "parley";
};

class WebSocketClient {
public:
    WebSocketClient();
    ~WebSocketClient();

    // Non-copyable
    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    /// Resolve, connect, TLS and WebSocket handshakes. Throws ConnectionError.
    void connect(const WebSocketEndpoint& endpoint);

    /// Send one text message. Throws ConnectionError when the socket is gone.
    void send_text(const std::string& message);

    /**
     * @brief Block for the next message
     * @return Message payload, or nullopt once the connection is closed
     */
    std::optional<std::string> read();

    /// Close the connection; blocked readers return nullopt. Never throws.
    void close();

    bool is_open() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley
