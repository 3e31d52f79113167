#include "net/websocket_client.h"
#include "errors.h"
#include "logger.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>
#include <atomic>
#include <mutex>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace parley {

class WebSocketClient::Impl {
public:
    using Stream = websocket::stream<beast::ssl_stream<tcp::socket>>;

    Impl() : ssl_ctx_(ssl::context::tlsv12_client) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }

    void connect(const WebSocketEndpoint& endpoint) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (open_) {
            return;
        }

        try {
            tcp::resolver resolver{ioc_};
            auto const results = resolver.resolve(endpoint.host, endpoint.port);

            ws_ = std::make_unique<Stream>(ioc_, ssl_ctx_);
            asio::connect(beast::get_lowest_layer(*ws_), results);

            // SNI is required by most hosted endpoints
            if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), endpoint.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
                throw beast::system_error{ec};
            }
            ws_->next_layer().set_verify_callback(ssl::host_name_verification(endpoint.host));
            ws_->next_layer().handshake(ssl::stream_base::client);

            auto headers = endpoint.headers;
            auto user_agent = endpoint.user_agent;
            ws_->set_option(websocket::stream_base::decorator(
                [headers, user_agent](websocket::request_type& req) {
                    req.set(beast::http::field::user_agent, user_agent);
                    for (const auto& header : headers) {
                        req.set(header.first, header.second);
                    }
                }));

            std::string host = endpoint.host;
            if (endpoint.port != "443") {
                host += ":" + endpoint.port;
            }
            ws_->handshake(host, endpoint.path);
            ws_->text(true);
            open_ = true;
            LOG_CONN("WebSocket open: " + endpoint.host + endpoint.path);
        } catch (const beast::system_error& e) {
            ws_.reset();
            throw ConnectionError("WebSocket connect to " + endpoint.host + " failed: " + e.code().message());
        } catch (const std::exception& e) {
            ws_.reset();
            throw ConnectionError("WebSocket connect to " + endpoint.host + " failed: " + e.what());
        }
    }

    void send_text(const std::string& message) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!open_ || !ws_) {
            throw ConnectionError("WebSocket is not open");
        }
        beast::error_code ec;
        ws_->write(asio::buffer(message), ec);
        if (ec) {
            open_ = false;
            throw ConnectionError("WebSocket write failed: " + ec.message());
        }
    }

    std::optional<std::string> read() {
        Stream* ws = nullptr;
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (!open_ || !ws_) return std::nullopt;
            ws = ws_.get();
        }

        beast::flat_buffer buffer;
        beast::error_code ec;
        ws->read(buffer, ec);
        if (ec) {
            if (ec != websocket::error::closed && open_) {
                LOG_CONN("WebSocket read ended: " + ec.message());
            }
            open_ = false;
            return std::nullopt;
        }
        return beast::buffers_to_string(buffer.data());
    }

    void close() {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!ws_) return;

        beast::error_code ec;
        if (open_) {
            open_ = false;
            ws_->close(websocket::close_code::normal, ec);
            if (ec) {
                LOG_DEBUG("WebSocket close handshake: " + ec.message());
            }
        }
        // Unblocks a reader still waiting on the socket
        auto& socket = beast::get_lowest_layer(*ws_);
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

    bool is_open() const { return open_.load(); }

private:
    asio::io_context ioc_;
    ssl::context ssl_ctx_;
    std::unique_ptr<Stream> ws_;
    std::mutex write_mutex_;
    std::atomic<bool> open_{false};
};

WebSocketClient::WebSocketClient() : impl_(std::make_unique<Impl>()) {}

WebSocketClient::~WebSocketClient() {
    impl_->close();
}

void WebSocketClient::connect(const WebSocketEndpoint& endpoint) {
    impl_->connect(endpoint);
}

void WebSocketClient::send_text(const std::string& message) {
    impl_->send_text(message);
}

std::optional<std::string> WebSocketClient::read() {
    return impl_->read();
}

void WebSocketClient::close() {
    impl_->close();
}

bool WebSocketClient::is_open() const {
    return impl_->is_open();
}

} // namespace parley
