#include "audio/audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <sstream>

namespace parley {

namespace {

/// Captured frames kept while nobody reads (about two seconds at 20 ms)
constexpr size_t MAX_INPUT_FRAMES = 100;

} // namespace

class AudioDevice::Impl {
public:
    Impl() = default;

    ~Impl() {
        stop();
    }

    bool start(const std::string& input_device, const std::string& output_device,
               int sample_rate, int frame_ms) {
        sample_rate_ = sample_rate;
        frame_samples_ = audio::ms_to_samples(frame_ms, sample_rate);
        stop_playback_ = false;

        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        initialized_ = true;

        int input_idx = find_device(input_device, true);
        if (input_idx < 0) {
            Logger::error("Input device not found: " + input_device);
            stop();
            return false;
        }
        int output_idx = find_device(output_device, false);
        if (output_idx < 0) {
            Logger::error("Output device not found: " + output_device);
            stop();
            return false;
        }

        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output_idx);
        if (!input_info || !output_info) {
            Logger::error("Audio device info unavailable");
            stop();
            return false;
        }

        std::ostringstream dev_oss;
        dev_oss << "Using input device: [" << input_idx << "] " << input_info->name
                << ", output device: [" << output_idx << "] " << output_info->name;
        Logger::info(dev_oss.str());

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = output_info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        // Same device for both directions: one full-duplex stream keeps them in step
        if (input_idx == output_idx &&
            Pa_IsFormatSupported(&input_params, &output_params, sample_rate_) == paFormatIsSupported) {
            err = Pa_OpenStream(&duplex_stream_, &input_params, &output_params, sample_rate_,
                                frame_samples_, paClipOff, duplex_callback, this);
            if (err == paNoError && Pa_StartStream(duplex_stream_) == paNoError) {
                Logger::info("Full-duplex stream opened");
                running_ = true;
                return true;
            }
            Logger::warn("Full-duplex stream failed, falling back to separate streams");
            if (duplex_stream_) {
                Pa_CloseStream(duplex_stream_);
                duplex_stream_ = nullptr;
            }
        }

        err = Pa_OpenStream(&input_stream_, &input_params, nullptr, sample_rate_,
                            frame_samples_, paClipOff, input_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        err = Pa_OpenStream(&output_stream_, nullptr, &output_params, sample_rate_,
                            frame_samples_, paClipOff, output_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        err = Pa_StartStream(input_stream_);
        if (err != paNoError) {
            Logger::error("Failed to start input stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }
        err = Pa_StartStream(output_stream_);
        if (err != paNoError) {
            Logger::error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        running_ = true;
        return true;
    }

    bool read_frame(PcmBuffer& frame, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(input_mutex_);
        input_cv_.wait_for(lock, timeout, [this] { return !input_queue_.empty() || !running_; });
        if (input_queue_.empty()) {
            return false;
        }
        frame = std::move(input_queue_.front());
        input_queue_.pop_front();
        return true;
    }

    bool play(const PcmBuffer& samples) {
        if (!running_) return false;
        std::lock_guard<std::mutex> lock(playback_mutex_);
        stop_playback_ = false;
        playback_queue_.insert(playback_queue_.end(), samples.begin(), samples.end());
        return true;
    }

    bool is_playback_complete() const {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        return playback_queue_.empty();
    }

    void stop_playback() {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        stop_playback_ = true;
        playback_queue_.clear();
    }

    void stop() {
        running_ = false;
        input_cv_.notify_all();

        for (PaStream** stream : {&duplex_stream_, &input_stream_, &output_stream_}) {
            if (*stream) {
                Pa_StopStream(*stream);
                Pa_CloseStream(*stream);
                *stream = nullptr;
            }
        }

        {
            std::lock_guard<std::mutex> lock(input_mutex_);
            input_queue_.clear();
        }
        {
            std::lock_guard<std::mutex> lock(playback_mutex_);
            playback_queue_.clear();
        }

        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    bool running() const { return running_; }
    int sample_rate() const { return sample_rate_; }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        Logger::info("Available audio devices:");

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name;
            if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
            if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
            if (info->maxInputChannels == 0 && info->maxOutputChannels == 0) oss << " (no I/O)";
            Logger::info(oss.str());
        }

        Pa_Terminate();
    }

private:
    int find_device(const std::string& name, bool is_input) {
        int num_devices = Pa_GetDeviceCount();

        if (name == "default" || name.empty()) {
            int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
            return default_idx == paNoDevice ? -1 : default_idx;
        }

        auto has_direction = [is_input](const PaDeviceInfo* info) {
            return info && (is_input ? info->maxInputChannels > 0 : info->maxOutputChannels > 0);
        };

        // Numeric device index
        if (std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            int device_idx = std::stoi(name);
            if (device_idx < num_devices && has_direction(Pa_GetDeviceInfo(device_idx))) {
                return device_idx;
            }
            return -1;
        }

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (has_direction(info) && name == info->name) {
                return i;
            }
        }
        return -1;
    }

    void capture(const void* input, unsigned long frame_count) {
        if (!input) return;
        const Sample* in = static_cast<const Sample*>(input);
        {
            std::lock_guard<std::mutex> lock(input_mutex_);
            if (input_queue_.size() >= MAX_INPUT_FRAMES) {
                input_queue_.pop_front();
            }
            input_queue_.emplace_back(in, in + frame_count);
        }
        input_cv_.notify_one();
    }

    void render(void* output, unsigned long frame_count) {
        Sample* out = static_cast<Sample*>(output);
        std::lock_guard<std::mutex> lock(playback_mutex_);

        size_t available = stop_playback_ ? 0 : std::min<size_t>(frame_count, playback_queue_.size());
        std::copy(playback_queue_.begin(), playback_queue_.begin() + available, out);
        playback_queue_.erase(playback_queue_.begin(), playback_queue_.begin() + available);
        if (available < frame_count) {
            std::memset(out + available, 0, (frame_count - available) * sizeof(Sample));
        }
    }

    static int input_callback(const void* input, void*, unsigned long frame_count,
                              const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags,
                              void* user_data) {
        static_cast<Impl*>(user_data)->capture(input, frame_count);
        return paContinue;
    }

    static int output_callback(const void*, void* output, unsigned long frame_count,
                               const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags,
                               void* user_data) {
        static_cast<Impl*>(user_data)->render(output, frame_count);
        return paContinue;
    }

    static int duplex_callback(const void* input, void* output, unsigned long frame_count,
                               const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags,
                               void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        self->capture(input, frame_count);
        self->render(output, frame_count);
        return paContinue;
    }

    PaStream* input_stream_ = nullptr;
    PaStream* output_stream_ = nullptr;
    PaStream* duplex_stream_ = nullptr;
    int sample_rate_ = audio::SAMPLE_RATE;
    size_t frame_samples_ = 0;
    bool initialized_ = false;
    std::atomic<bool> running_{false};

    mutable std::mutex playback_mutex_;
    std::deque<Sample> playback_queue_;
    bool stop_playback_ = false;

    std::mutex input_mutex_;
    std::condition_variable input_cv_;
    std::deque<PcmBuffer> input_queue_;
};

AudioDevice::AudioDevice() : pimpl_(std::make_unique<Impl>()) {}
AudioDevice::~AudioDevice() = default;

bool AudioDevice::start(const std::string& input_device, const std::string& output_device,
                        int sample_rate, int frame_ms) {
    return pimpl_->start(input_device, output_device, sample_rate, frame_ms);
}

bool AudioDevice::read_frame(PcmBuffer& frame, std::chrono::milliseconds timeout) {
    return pimpl_->read_frame(frame, timeout);
}

bool AudioDevice::play(const PcmBuffer& samples) {
    return pimpl_->play(samples);
}

bool AudioDevice::is_playback_complete() const {
    return pimpl_->is_playback_complete();
}

void AudioDevice::stop_playback() {
    pimpl_->stop_playback();
}

void AudioDevice::stop() {
    pimpl_->stop();
}

bool AudioDevice::running() const {
    return pimpl_->running();
}

int AudioDevice::sample_rate() const {
    return pimpl_->sample_rate();
}

void AudioDevice::list_devices() {
    Impl::list_devices();
}

} // namespace parley
