#pragma once

/**
 * @file transport_stages.h
 * @brief Local audio device at both ends of the pipeline
 */

#include "audio/audio_io.h"
#include "core/config.h"
#include "pipeline/stage.h"
#include <atomic>
#include <memory>

namespace parley {
namespace stages {

/**
 * @brief Source stage reading fixed-size PCM16 mono frames from the device
 *
 * Opens the device when Start passes through and announces TransportReady
 * right behind it.
 */
class CaptureStage : public pipeline::SourceStage {
public:
    CaptureStage(std::shared_ptr<AudioDevice> device, config::AudioConfig config);

    void process(Frame frame, Direction direction) override;
    std::optional<Frame> pull(std::chrono::milliseconds timeout) override;
    void cancel() override;
    void cleanup() override;

private:
    std::shared_ptr<AudioDevice> device_;
    config::AudioConfig config_;
    std::atomic<bool> open_{false};
};

/**
 * @brief Plays Audio frames on the device
 *
 * Interruption stops playback at once. Image frames have nowhere to go
 * on a local device and are dropped (logged once). End waits for queued
 * playback to finish before it leaves the pipeline.
 */
class OutputStage : public pipeline::Stage {
public:
    explicit OutputStage(std::shared_ptr<AudioDevice> device);

    void process(Frame frame, Direction direction) override;
    void interrupt() override;

    uint64_t played_frames() const { return played_.load(); }
    uint64_t dropped_images() const { return dropped_images_.load(); }

private:
    void play(const AudioData& audio);
    void drain();

    std::shared_ptr<AudioDevice> device_;
    std::atomic<uint64_t> played_{0};
    std::atomic<uint64_t> dropped_images_{0};
};

} // namespace stages
} // namespace parley
