#pragma once

#include "core/types.h"
#include <chrono>
#include <memory>
#include <string>

namespace parley {

/**
 * @brief Local audio transport using PortAudio
 *
 * Captures fixed-size PCM16 mono frames from the input device and plays
 * PCM16 mono buffers on the output device. Both directions are callback
 * driven: captured frames wait in a bounded queue for read_frame(), and
 * queued playback samples are drained by the output callback.
 *
 * Thread Safety:
 * - read_frame() and play() may be called from different threads
 * - PortAudio callbacks run on PortAudio's own thread
 * - stop_playback() is safe from any thread
 */
class AudioDevice {
public:
    AudioDevice();
    ~AudioDevice();

    // Non-copyable
    AudioDevice(const AudioDevice&) = delete;
    AudioDevice& operator=(const AudioDevice&) = delete;

    /**
     * @brief Open devices and start streams
     * @param input_device Device name, index or "default"
     * @param output_device Device name, index or "default"
     * @param sample_rate Rate of both streams in Hz
     * @param frame_ms Capture frame length
     * @return True if both streams are running
     */
    bool start(const std::string& input_device,
               const std::string& output_device,
               int sample_rate,
               int frame_ms);

    /**
     * @brief Wait up to timeout for the next captured frame
     * @return True if a frame was read
     */
    bool read_frame(PcmBuffer& frame, std::chrono::milliseconds timeout);

    /// Queue samples behind whatever is already playing
    bool play(const PcmBuffer& samples);

    bool is_playback_complete() const;

    /// Stop playback immediately and clear the queue
    void stop_playback();

    /// Stop all audio I/O and close streams
    void stop();

    bool running() const;
    int sample_rate() const;

    /**
     * @brief List all available audio devices to the log
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace parley
