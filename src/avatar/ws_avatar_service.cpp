#include "avatar/ws_avatar_service.h"
#include "core/base64.h"
#include "errors.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

using json = nlohmann::json;

namespace parley {

namespace {

const char* pixel_format_name(PixelFormat format) {
    switch (format) {
        case PixelFormat::RGB24: return "rgb24";
        case PixelFormat::RGBA32: return "rgba32";
        case PixelFormat::Gray8: return "gray8";
    }
    return "rgb24";
}

/// Unbounded blocking queue closed once the socket goes away
template<typename T>
class Mailbox {
public:
    void push(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        items_.push_back(std::move(item));
        cv_.notify_one();
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // anonymous namespace

class WsAvatarService::Impl {
public:
    explicit Impl(WsAvatarEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

    ~Impl() { stop(); }

    void start() {
        if (endpoint_.host.empty()) {
            throw ConfigurationError("avatar host is not configured");
        }

        WebSocketEndpoint ws;
        ws.host = endpoint_.host;
        ws.port = endpoint_.port;
        ws.path = endpoint_.path;
        if (!endpoint_.avatar_id.empty()) {
            ws.path += (ws.path.find('?') == std::string::npos ? "?" : "&");
            ws.path += "avatar_id=" + endpoint_.avatar_id;
        }
        ws.headers.emplace_back("Authorization", "Bearer " + endpoint_.api_key);

        client_.connect(ws);
        sender_alive_ = true;
        reader_ = std::thread(&Impl::reader_loop, this);
        sender_ = std::thread(&Impl::sender_loop, this);
        LOG_AVATAR("Connected to " + endpoint_.host);
    }

    void stop() {
        if (stopping_.exchange(true)) {
            return;
        }
        outbound_.close();
        client_.close();
        join(sender_);
        join(reader_);
        audio_in_.close();
        video_in_.close();
    }

    bool is_connected() const { return client_.is_open() && !stopping_; }
    bool sender_alive() const { return sender_alive_.load(); }

    void send(json message) {
        if (!is_connected() || !sender_alive_) {
            throw UpstreamServiceError("avatar connection is not open");
        }
        outbound_.push(message.dump());
    }

    std::string next_message_id() {
        return "parley-" + std::to_string(++message_counter_);
    }

    std::optional<AvatarAudioChunk> read_audio() { return audio_in_.pop(); }
    std::optional<AvatarVideoFrame> read_video() { return video_in_.pop(); }

private:
    void join(std::thread& thread) {
        if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
            thread.join();
        }
    }

    void sender_loop() {
        while (auto message = outbound_.pop()) {
            try {
                client_.send_text(*message);
            } catch (const ConnectionError& e) {
                if (!stopping_) {
                    LOG_ERROR(std::string("[Avatar] Sender stopped: ") + e.what());
                }
                break;
            }
        }
        sender_alive_ = false;
    }

    void reader_loop() {
        while (auto raw = client_.read()) {
            auto message = decode_avatar_message(*raw);
            if (!message) continue;

            switch (message->kind) {
                case AvatarInbound::Kind::Audio:
                    audio_in_.push(std::move(message->audio));
                    break;
                case AvatarInbound::Kind::Video:
                    video_in_.push(std::move(message->video));
                    break;
                case AvatarInbound::Kind::Error:
                    LOG_ERROR("[Avatar] Service error: " + message->detail);
                    break;
                case AvatarInbound::Kind::Other:
                    LOG_DEBUG("Avatar message ignored: " + message->type);
                    break;
            }
        }

        // The socket is gone: both receive streams end here
        audio_in_.close();
        video_in_.close();
    }

    WsAvatarEndpoint endpoint_;
    WebSocketClient client_;
    std::thread reader_;
    std::thread sender_;
    std::atomic<bool> sender_alive_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<uint64_t> message_counter_{0};

    Mailbox<std::string> outbound_;
    Mailbox<AvatarAudioChunk> audio_in_;
    Mailbox<AvatarVideoFrame> video_in_;
};

// =============================================================================
// Inbound decoding
// =============================================================================

std::optional<AvatarInbound> decode_avatar_message(const std::string& raw) {
    AvatarInbound inbound;
    try {
        json message = json::parse(raw);
        if (!message.is_object()) {
            LOG_WARN("[Avatar] Ignoring non-object message");
            return std::nullopt;
        }

        inbound.type = message.value("type", "");
        if (inbound.type == "audio") {
            inbound.kind = AvatarInbound::Kind::Audio;
            inbound.audio.pcm = base64::decode(message.value("data", ""));
            inbound.audio.sample_rate = message.value("sample_rate", audio::SAMPLE_RATE);
            inbound.audio.channels = message.value("channels", 1);
        } else if (inbound.type == "video") {
            inbound.kind = AvatarInbound::Kind::Video;
            inbound.video.pixels = base64::decode(message.value("data", ""));
            inbound.video.width = message.value("width", 0);
            inbound.video.height = message.value("height", 0);
            inbound.video.format = PixelFormat::RGB24;
        } else if (inbound.type == "error") {
            inbound.kind = AvatarInbound::Kind::Error;
            inbound.detail = message.dump();
        }
    } catch (const json::exception& e) {
        LOG_WARN(std::string("[Avatar] Ignoring malformed message: ") + e.what());
        return std::nullopt;
    }
    return inbound;
}

// =============================================================================
// WsAvatarService Public Interface
// =============================================================================

WsAvatarService::WsAvatarService(WsAvatarEndpoint endpoint)
    : impl_(std::make_unique<Impl>(std::move(endpoint))) {}

WsAvatarService::~WsAvatarService() = default;

void WsAvatarService::start() {
    impl_->start();
}

void WsAvatarService::stop() {
    impl_->stop();
}

bool WsAvatarService::is_connected() const {
    return impl_->is_connected();
}

bool WsAvatarService::sender_alive() const {
    return impl_->sender_alive();
}

void WsAvatarService::send_text(const std::string& text) {
    impl_->send({
        {"v", 2},
        {"type", "chat"},
        {"mid", impl_->next_message_id()},
        {"idx", 0},
        {"fin", true},
        {"pld", {{"text", text}}}
    });
}

void WsAvatarService::send_audio(const AudioData& audio) {
    impl_->send({
        {"type", "agent.speak"},
        {"audio", base64::encode(audio.bytes)},
        {"sample_rate", audio.sample_rate}
    });
}

void WsAvatarService::send_end_of_speech() {
    impl_->send({{"type", "agent.speak_end"}});
}

void WsAvatarService::send_image(const ImageData& image) {
    impl_->send({
        {"type", "video"},
        {"width", image.width},
        {"height", image.height},
        {"format", pixel_format_name(image.format)},
        {"data", base64::encode(image.bytes)}
    });
}

void WsAvatarService::interrupt() {
    impl_->send({{"type", "command"}, {"pld", {{"cmd", "interrupt"}}}});
}

std::optional<AvatarAudioChunk> WsAvatarService::read_audio() {
    return impl_->read_audio();
}

std::optional<AvatarVideoFrame> WsAvatarService::read_video() {
    return impl_->read_video();
}

} // namespace parley
