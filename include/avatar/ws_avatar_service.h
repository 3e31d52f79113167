#pragma once

/**
 * @file ws_avatar_service.h
 * @brief AvatarService over a JSON WebSocket protocol
 */

#include "avatar/avatar_service.h"
#include "net/websocket_client.h"
#include <memory>
#include <optional>
#include <string>

namespace parley {

struct WsAvatarEndpoint {
    std::string host;
    std::string port = "443";
    std::string path = "/v1/stream";
    std::string api_key;
    std::string avatar_id;
};

/// One inbound protocol message, decoded
struct AvatarInbound {
    enum class Kind {
        Audio,
        Video,
        Error,
        Other
    };

    Kind kind = Kind::Other;
    std::string type;
    AvatarAudioChunk audio;     ///< Set for Kind::Audio
    AvatarVideoFrame video;     ///< Set for Kind::Video
    std::string detail;         ///< Raw message for Kind::Error
};

/**
 * @brief Decode one inbound message
 * @return nullopt for anything that is not a JSON object with the
 *         expected field types (logged and skipped by the reader)
 */
std::optional<AvatarInbound> decode_avatar_message(const std::string& raw);

/**
 * @brief Avatar service speaking the streaming JSON protocol
 *
 * One reader thread demultiplexes inbound messages into the audio and
 * video receive streams; one sender thread drains the outbound queue.
 */
class WsAvatarService : public AvatarService {
public:
    explicit WsAvatarService(WsAvatarEndpoint endpoint);
    ~WsAvatarService() override;

    void start() override;
    void stop() override;

    bool is_connected() const override;
    bool sender_alive() const override;

    void send_text(const std::string& text) override;
    void send_audio(const AudioData& audio) override;
    void send_end_of_speech() override;
    void send_image(const ImageData& image) override;
    void interrupt() override;

    std::optional<AvatarAudioChunk> read_audio() override;
    std::optional<AvatarVideoFrame> read_video() override;

    std::string name() const override { return "ws-avatar"; }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley
