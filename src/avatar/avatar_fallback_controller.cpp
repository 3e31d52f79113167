#include "avatar/avatar_fallback_controller.h"
#include "errors.h"
#include "logger.h"
#include "utils.h"

namespace parley {

const char* avatar_state_name(AvatarState state) {
    switch (state) {
        case AvatarState::Active: return "active";
        case AvatarState::Degraded: return "degraded";
        case AvatarState::Terminal: return "terminal";
    }
    return "unknown";
}

std::optional<AvatarMode> parse_avatar_mode(const std::string& name) {
    std::string lower = utils::normalize_copy(name);
    if (lower == "audio") return AvatarMode::Audio;
    if (lower == "text") return AvatarMode::Text;
    return std::nullopt;
}

AvatarFallbackController::AvatarFallbackController(std::shared_ptr<AvatarService> service,
                                                   AvatarOptions options)
    : service_(std::move(service))
    , options_(options)
    , text_buffer_(options.text_max_chars)
    , video_throttle_(options.video_fps)
    , resampler_(options.output_sample_rate, options.output_sample_rate) {}

AvatarFallbackController::~AvatarFallbackController() {
    shutdown();
}

bool AvatarFallbackController::start(MediaSink sink) {
    sink_ = std::move(sink);

    try {
        service_->start();
    } catch (const std::exception& e) {
        degrade(std::string("start failed: ") + e.what());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != AvatarState::Active) {
            return false;
        }
        started_ = true;
    }

    audio_thread_ = std::thread(&AvatarFallbackController::audio_receiver, this);
    video_thread_ = std::thread(&AvatarFallbackController::video_receiver, this);
    LOG_AVATAR(service_->name() + " active (" +
               (options_.mode == AvatarMode::Text ? "text" : "audio") + " mode)");
    return true;
}

// =============================================================================
// Outbound
// =============================================================================

bool AvatarFallbackController::handle_audio(const AudioData& audio) {
    if (!check_health()) {
        return false;
    }
    try {
        service_->send_audio(audio);
        return true;
    } catch (const PipelineError& e) {
        degrade(std::string("audio send failed: ") + e.what());
        return false;
    }
}

bool AvatarFallbackController::handle_text(const std::string& token) {
    if (options_.mode != AvatarMode::Text || !check_health()) {
        return false;
    }

    std::optional<std::string> chunk;
    {
        std::lock_guard<std::mutex> lock(text_mutex_);
        chunk = text_buffer_.append(token);
    }
    if (!chunk) {
        return true;
    }

    try {
        service_->send_text(*chunk);
        return true;
    } catch (const PipelineError& e) {
        degrade(std::string("text send failed: ") + e.what());
        return false;
    }
}

bool AvatarFallbackController::handle_participant_image(const ImageData& image, TimePoint now) {
    if (!check_health()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(video_mutex_);
        if (!video_throttle_.accept(now)) {
            return true;
        }
    }
    try {
        service_->send_image(image);
        return true;
    } catch (const PipelineError& e) {
        degrade(std::string("video send failed: ") + e.what());
        return false;
    }
}

void AvatarFallbackController::end_of_turn() {
    if (!check_health()) {
        return;
    }

    try {
        if (options_.mode == AvatarMode::Text) {
            std::optional<std::string> rest;
            {
                std::lock_guard<std::mutex> lock(text_mutex_);
                rest = text_buffer_.flush();
            }
            if (rest) {
                service_->send_text(*rest);
            }
        } else {
            service_->send_end_of_speech();
        }
    } catch (const PipelineError& e) {
        degrade(std::string("end of turn failed: ") + e.what());
    }
}

void AvatarFallbackController::interrupt() {
    {
        std::lock_guard<std::mutex> lock(text_mutex_);
        text_buffer_.clear();
    }
    if (!active()) {
        return;
    }
    try {
        service_->interrupt();
    } catch (const PipelineError& e) {
        degrade(std::string("interrupt failed: ") + e.what());
    }
}

// =============================================================================
// State
// =============================================================================

bool AvatarFallbackController::degrade(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++degrade_triggers_;
        if (state_ != AvatarState::Active) {
            return false;
        }
        state_ = AvatarState::Degraded;

        // Teardown must not hold up the frame that triggered the degrade
        std::shared_ptr<AvatarService> service = service_;
        teardown_thread_ = std::thread([service]() {
            try {
                service->stop();
            } catch (const std::exception& e) {
                LOG_DEBUG(std::string("Avatar teardown error ignored: ") + e.what());
            }
        });
    }

    LOG_WARN("[Avatar] Degraded to audio-only: " + reason);
    std::lock_guard<std::mutex> lock(text_mutex_);
    text_buffer_.clear();
    return true;
}

bool AvatarFallbackController::check_health() {
    if (!active()) {
        return false;
    }
    if (!service_->is_connected()) {
        degrade("connection closed");
        return false;
    }
    if (!service_->sender_alive()) {
        degrade("sender task terminated");
        return false;
    }
    return true;
}

void AvatarFallbackController::close() {
    AvatarState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == AvatarState::Terminal) {
            return;
        }
        previous = state_;
        state_ = AvatarState::Terminal;
    }

    if (previous == AvatarState::Active) {
        try {
            service_->stop();
        } catch (const std::exception& e) {
            LOG_WARN(std::string("[Avatar] Stop failed: ") + e.what());
        }
    }
}

void AvatarFallbackController::shutdown() {
    close();
    if (teardown_thread_.joinable()) teardown_thread_.join();
    if (audio_thread_.joinable()) audio_thread_.join();
    if (video_thread_.joinable()) video_thread_.join();
}

AvatarState AvatarFallbackController::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

int AvatarFallbackController::degrade_triggers() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return degrade_triggers_;
}

// =============================================================================
// Receivers
// =============================================================================

void AvatarFallbackController::on_stream_ended(const char* stream) {
    if (state() == AvatarState::Active) {
        degrade(std::string(stream) + " stream ended");
    } else {
        LOG_DEBUG(std::string("Avatar ") + stream + " receiver finished");
    }
}

void AvatarFallbackController::audio_receiver() {
    while (true) {
        std::optional<AvatarAudioChunk> chunk = service_->read_audio();
        if (!chunk) {
            on_stream_ended("audio");
            return;
        }
        if (!active()) {
            continue;
        }

        try {
            ByteBuffer mono = convert::to_mono16(chunk->pcm, chunk->channels, 16);
            resampler_.set_rates(chunk->sample_rate, options_.output_sample_rate);
            PcmBuffer out = resampler_.process(convert::bytes_to_samples(mono));
            if (out.empty()) {
                continue;
            }
            if (!sink_(Frame::audio(out, options_.output_sample_rate))) {
                return;
            }
        } catch (const MediaFormatError& e) {
            LOG_WARN(std::string("[Avatar] Dropping malformed audio chunk: ") + e.what());
        }
    }
}

void AvatarFallbackController::video_receiver() {
    while (true) {
        std::optional<AvatarVideoFrame> video = service_->read_video();
        if (!video) {
            on_stream_ended("video");
            return;
        }
        if (!active()) {
            continue;
        }
        if (!sink_(Frame::image(std::move(video->pixels), video->width, video->height, video->format))) {
            return;
        }
    }
}

} // namespace parley
