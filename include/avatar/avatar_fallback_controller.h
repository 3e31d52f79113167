#pragma once

/**
 * @file avatar_fallback_controller.h
 * @brief One-way degrade from avatar rendering to audio-only output
 *
 * Features:
 * - Active -> Degraded on failed sends, a dead sender task or an ended receive stream
 * - Idempotent degrade with asynchronous best-effort teardown
 * - Receiver threads bridging avatar audio/video back into the pipeline
 * - Text chunking and participant-video throttling toward the avatar
 */

#include "audio/format_converter.h"
#include "core/constants.h"
#include "avatar/avatar_service.h"
#include "core/frame.h"
#include "text/text_flush_buffer.h"
#include "vision/vision_snapshot.h"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace parley {

enum class AvatarState {
    Active,
    Degraded,
    Terminal
};

const char* avatar_state_name(AvatarState state);

/// What the avatar renders from
enum class AvatarMode {
    Audio,   ///< Lip-syncs the synthesized speech
    Text     ///< Speaks text itself; replaces local synthesis
};

std::optional<AvatarMode> parse_avatar_mode(const std::string& name);

struct AvatarOptions {
    AvatarMode mode = AvatarMode::Audio;
    int output_sample_rate = audio::SAMPLE_RATE;
    int video_fps = constants::vision::DEFAULT_FPS;
    size_t text_max_chars = constants::flush::MAX_CHARS;
};

/**
 * @brief Wraps an AvatarService and owns the Active/Degraded/Terminal state
 *
 * The handle_* methods return true when the avatar consumed the frame and
 * false when the caller must pass it straight to output. A frame in
 * flight during a degrade is never lost: the failing call returns false.
 */
class AvatarFallbackController {
public:
    /// Receives frames produced by the avatar; returns false once the pipeline is closed
    using MediaSink = std::function<bool(Frame frame)>;

    AvatarFallbackController(std::shared_ptr<AvatarService> service, AvatarOptions options);
    ~AvatarFallbackController();

    // Non-copyable
    AvatarFallbackController(const AvatarFallbackController&) = delete;
    AvatarFallbackController& operator=(const AvatarFallbackController&) = delete;

    /**
     * @brief Start the service and the receiver threads
     * @return True if Active; a start failure degrades instead of throwing
     */
    bool start(MediaSink sink);

    bool handle_audio(const AudioData& audio);
    bool handle_text(const std::string& token);
    bool handle_participant_image(const ImageData& image, TimePoint now = Clock::now());

    /// Flush pending text (text mode) or signal end of speech (audio mode)
    void end_of_turn();

    /// Barge-in: drop pending text and tell the avatar to stop speaking
    void interrupt();

    /**
     * @brief Transition Active -> Degraded
     * @return True if this call performed the transition
     */
    bool degrade(const std::string& reason);

    /// Stop the service without waiting for receivers (safe from any thread)
    void close();

    /// Enter Terminal and join every thread
    void shutdown();

    AvatarState state() const;
    bool active() const { return state() == AvatarState::Active; }
    AvatarMode mode() const { return options_.mode; }

    /// Number of degrade triggers observed, including collapsed duplicates
    int degrade_triggers() const;

private:
    bool check_health();
    void audio_receiver();
    void video_receiver();
    void on_stream_ended(const char* stream);

    std::shared_ptr<AvatarService> service_;
    AvatarOptions options_;
    MediaSink sink_;

    mutable std::mutex state_mutex_;
    AvatarState state_ = AvatarState::Active;
    int degrade_triggers_ = 0;
    bool started_ = false;
    std::thread teardown_thread_;

    std::mutex text_mutex_;
    TextFlushBuffer text_buffer_;

    std::mutex video_mutex_;
    FrameThrottle video_throttle_;

    convert::StreamResampler resampler_;
    std::thread audio_thread_;
    std::thread video_thread_;
};

} // namespace parley
