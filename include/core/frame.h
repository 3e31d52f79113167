#pragma once

/**
 * @file frame.h
 * @brief Typed media/control unit flowing through the pipeline
 */

#include "core/types.h"
#include "errors.h"
#include <cstdint>
#include <string>
#include <variant>

namespace parley {

/// Flow direction: downstream goes toward the participant, upstream toward the model
enum class Direction {
    Downstream,
    Upstream
};

enum class FrameType {
    Audio,
    Text,
    Image,
    Control
};

enum class ControlKind {
    Start,
    End,
    Cancel,
    Interruption,
    TransportReady,
    TurnReady,       ///< A user turn was committed to the conversation context
    ResponseStart,   ///< First token of one language-model response follows
    ResponseEnd,
    Error
};

enum class PixelFormat {
    RGB24,
    RGBA32,
    Gray8
};

int bytes_per_pixel(PixelFormat format);
const char* control_kind_name(ControlKind kind);

/**
 * @brief Raw little-endian PCM16 audio
 *
 * num_samples counts samples per channel, so bytes.size() ==
 * num_samples * channels * 2 for every well-formed frame.
 */
struct AudioData {
    ByteBuffer bytes;
    int sample_rate = audio::SAMPLE_RATE;
    int channels = 1;
    size_t num_samples = 0;
};

struct TextData {
    std::string text;
    bool final = false;
};

struct ImageData {
    ByteBuffer bytes;
    int width = 0;
    int height = 0;
    PixelFormat format = PixelFormat::RGB24;
};

struct ControlData {
    ControlKind kind = ControlKind::Start;
    Error error;           ///< Set for ControlKind::Error
    bool fatal = false;
};

/**
 * @brief Tagged frame with a process-wide sequence id
 *
 * Frames are treated as immutable once produced. The only sanctioned
 * mutation is in-place audio mixing, which keeps byte length and
 * sample count unchanged.
 */
class Frame {
public:
    using Payload = std::variant<AudioData, TextData, ImageData, ControlData>;

    static Frame audio(ByteBuffer bytes, int sample_rate, int channels = 1);
    static Frame audio(const PcmBuffer& samples, int sample_rate);
    static Frame text(std::string text, bool final = true);
    static Frame image(ByteBuffer bytes, int width, int height, PixelFormat format);
    static Frame control(ControlKind kind);
    static Frame error(const Error& error, bool fatal);

    uint64_t id() const { return id_; }
    Direction direction() const { return direction_; }
    void set_direction(Direction direction) { direction_ = direction; }

    FrameType type() const;
    bool is_audio() const { return type() == FrameType::Audio; }
    bool is_text() const { return type() == FrameType::Text; }
    bool is_image() const { return type() == FrameType::Image; }
    bool is_control() const { return type() == FrameType::Control; }
    bool is_control(ControlKind kind) const;

    const AudioData& as_audio() const { return std::get<AudioData>(payload_); }
    AudioData& mutable_audio() { return std::get<AudioData>(payload_); }
    const TextData& as_text() const { return std::get<TextData>(payload_); }
    const ImageData& as_image() const { return std::get<ImageData>(payload_); }
    const ControlData& as_control() const { return std::get<ControlData>(payload_); }

    /// Short human-readable description for logs
    std::string describe() const;

private:
    explicit Frame(Payload payload);

    uint64_t id_;
    Direction direction_ = Direction::Downstream;
    Payload payload_;
};

} // namespace parley
