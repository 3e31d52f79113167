#include "stages/transport_stages.h"
#include "audio/format_converter.h"
#include "errors.h"
#include "logger.h"
#include <thread>

namespace parley {
namespace stages {

namespace {

/// Longest wait for queued playback when the session drains
constexpr auto DRAIN_LIMIT = std::chrono::seconds(10);

} // namespace

// =============================================================================
// CaptureStage
// =============================================================================

CaptureStage::CaptureStage(std::shared_ptr<AudioDevice> device, config::AudioConfig config)
    : SourceStage("capture")
    , device_(std::move(device))
    , config_(std::move(config)) {}

void CaptureStage::process(Frame frame, Direction direction) {
    if (frame.is_control(ControlKind::Start) && direction == Direction::Downstream) {
        if (!device_->running() &&
            !device_->start(config_.input_device, config_.output_device,
                            config_.sample_rate, config_.frame_ms)) {
            throw ConfigurationError("audio device could not be opened (" +
                                     config_.input_device + " / " + config_.output_device + ")");
        }
        open_ = true;
        LOG_AUDIO("Capturing " + std::to_string(config_.frame_ms) + " ms frames at " +
                  std::to_string(config_.sample_rate) + " Hz");
        push_frame(std::move(frame));
        push_frame(Frame::control(ControlKind::TransportReady));
        return;
    }
    push_frame(std::move(frame), direction);
}

std::optional<Frame> CaptureStage::pull(std::chrono::milliseconds timeout) {
    if (!open_) {
        std::this_thread::sleep_for(timeout);
        return std::nullopt;
    }
    PcmBuffer samples;
    if (!device_->read_frame(samples, timeout)) {
        return std::nullopt;
    }
    return Frame::audio(samples, config_.sample_rate);
}

void CaptureStage::cancel() {
    open_ = false;
}

void CaptureStage::cleanup() {
    open_ = false;
    device_->stop();
}

// =============================================================================
// OutputStage
// =============================================================================

OutputStage::OutputStage(std::shared_ptr<AudioDevice> device)
    : Stage("output")
    , device_(std::move(device)) {}

void OutputStage::process(Frame frame, Direction direction) {
    if (direction == Direction::Downstream) {
        if (frame.is_audio()) {
            play(frame.as_audio());
        } else if (frame.is_image()) {
            if (dropped_images_++ == 0) {
                LOG_INFO("Output has no video sink; dropping image frames");
            }
            return;
        } else if (frame.is_control(ControlKind::Interruption)) {
            device_->stop_playback();
        } else if (frame.is_control(ControlKind::End)) {
            drain();
        }
    }
    push_frame(std::move(frame), direction);
}

void OutputStage::interrupt() {
    device_->stop_playback();
}

void OutputStage::play(const AudioData& audio) {
    if (!device_->running()) return;

    // The device runs at one rate in mono; convert whatever arrives
    ByteBuffer mono;
    try {
        mono = audio.channels == 1 ? audio.bytes
                                   : convert::to_mono16(audio.bytes, audio.channels, 16);
        if (audio.sample_rate != device_->sample_rate()) {
            mono = convert::resample(mono, audio.sample_rate, device_->sample_rate());
        }
    } catch (const MediaFormatError& e) {
        LOG_WARN(std::string("Skipping unplayable audio frame: ") + e.what());
        return;
    }
    device_->play(convert::bytes_to_samples(mono));
    played_++;
}

void OutputStage::drain() {
    auto deadline = Clock::now() + DRAIN_LIMIT;
    while (device_->running() && !device_->is_playback_complete() && Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

} // namespace stages
} // namespace parley
