#pragma once

/**
 * @file avatar_service.h
 * @brief Narrow interface to an external avatar-rendering service
 */

#include "core/frame.h"
#include <optional>
#include <string>

namespace parley {

/// Audio chunk received from the avatar (PCM16, any rate and channel count)
struct AvatarAudioChunk {
    ByteBuffer pcm;
    int sample_rate = audio::SAMPLE_RATE;
    int channels = 1;
};

/// Video frame received from the avatar
struct AvatarVideoFrame {
    ByteBuffer pixels;
    int width = 0;
    int height = 0;
    PixelFormat format = PixelFormat::RGB24;
};

/**
 * @brief Avatar rendering service
 *
 * Sends may be called from the pipeline thread while the two receive
 * streams are drained by dedicated threads. Send methods throw
 * UpstreamServiceError or ConnectionError on failure. The receive
 * methods block and return nullopt once their stream has ended.
 */
class AvatarService {
public:
    virtual ~AvatarService() = default;

    /// Open the session and start the sender task
    virtual void start() = 0;

    /// Close the session; unblocks both receive streams
    virtual void stop() = 0;

    virtual bool is_connected() const = 0;

    /// Health check: false once the outbound sender task has terminated
    virtual bool sender_alive() const = 0;

    virtual void send_text(const std::string& text) = 0;
    virtual void send_audio(const AudioData& audio) = 0;
    virtual void send_end_of_speech() = 0;
    virtual void send_image(const ImageData& image) = 0;
    virtual void interrupt() = 0;

    virtual std::optional<AvatarAudioChunk> read_audio() = 0;
    virtual std::optional<AvatarVideoFrame> read_video() = 0;

    virtual std::string name() const = 0;
};

} // namespace parley
