/**
 * @file frame.cpp
 * @brief Frame factories and helpers
 */

#include "core/frame.h"
#include <atomic>
#include <sstream>

namespace parley {

namespace {

std::atomic<uint64_t> g_next_frame_id{1};

} // anonymous namespace

int bytes_per_pixel(PixelFormat format) {
    switch (format) {
        case PixelFormat::RGB24: return 3;
        case PixelFormat::RGBA32: return 4;
        case PixelFormat::Gray8: return 1;
    }
    return 3;
}

const char* control_kind_name(ControlKind kind) {
    switch (kind) {
        case ControlKind::Start: return "Start";
        case ControlKind::End: return "End";
        case ControlKind::Cancel: return "Cancel";
        case ControlKind::Interruption: return "Interruption";
        case ControlKind::TransportReady: return "TransportReady";
        case ControlKind::TurnReady: return "TurnReady";
        case ControlKind::ResponseStart: return "ResponseStart";
        case ControlKind::ResponseEnd: return "ResponseEnd";
        case ControlKind::Error: return "Error";
    }
    return "Unknown";
}

Frame::Frame(Payload payload)
    : id_(g_next_frame_id.fetch_add(1, std::memory_order_relaxed))
    , payload_(std::move(payload)) {}

Frame Frame::audio(ByteBuffer bytes, int sample_rate, int channels) {
    AudioData data;
    int safe_channels = channels > 0 ? channels : 1;
    data.num_samples = bytes.size() / (static_cast<size_t>(audio::BYTES_PER_SAMPLE) * safe_channels);
    data.bytes = std::move(bytes);
    data.sample_rate = sample_rate;
    data.channels = safe_channels;
    return Frame(std::move(data));
}

Frame Frame::audio(const PcmBuffer& samples, int sample_rate) {
    ByteBuffer bytes(samples.size() * audio::BYTES_PER_SAMPLE);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t v = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<uint8_t>(v & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>(v >> 8);
    }
    return audio(std::move(bytes), sample_rate, 1);
}

Frame Frame::text(std::string text, bool final) {
    TextData data;
    data.text = std::move(text);
    data.final = final;
    return Frame(std::move(data));
}

Frame Frame::image(ByteBuffer bytes, int width, int height, PixelFormat format) {
    ImageData data;
    data.bytes = std::move(bytes);
    data.width = width;
    data.height = height;
    data.format = format;
    return Frame(std::move(data));
}

Frame Frame::control(ControlKind kind) {
    ControlData data;
    data.kind = kind;
    return Frame(std::move(data));
}

Frame Frame::error(const Error& error, bool fatal) {
    ControlData data;
    data.kind = ControlKind::Error;
    data.error = error;
    data.fatal = fatal;
    return Frame(std::move(data));
}

FrameType Frame::type() const {
    switch (payload_.index()) {
        case 0: return FrameType::Audio;
        case 1: return FrameType::Text;
        case 2: return FrameType::Image;
        default: return FrameType::Control;
    }
}

bool Frame::is_control(ControlKind kind) const {
    return is_control() && as_control().kind == kind;
}

std::string Frame::describe() const {
    std::ostringstream oss;
    oss << "#" << id_ << " ";
    switch (type()) {
        case FrameType::Audio: {
            const auto& a = as_audio();
            oss << "Audio(" << a.num_samples << " samples @" << a.sample_rate << "Hz x" << a.channels << ")";
            break;
        }
        case FrameType::Text: {
            const auto& t = as_text();
            oss << "Text(\"" << t.text << "\"" << (t.final ? ", final" : "") << ")";
            break;
        }
        case FrameType::Image: {
            const auto& img = as_image();
            oss << "Image(" << img.width << "x" << img.height << ")";
            break;
        }
        case FrameType::Control: {
            const auto& c = as_control();
            oss << control_kind_name(c.kind);
            if (c.kind == ControlKind::Error) {
                oss << "(" << error_type_name(c.error.type) << ": " << c.error.message
                    << (c.fatal ? ", fatal" : "") << ")";
            }
            break;
        }
    }
    return oss.str();
}

} // namespace parley
