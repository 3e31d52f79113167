#include "stt/whisper_recognizer.h"
#include "audio/format_converter.h"
#include "errors.h"
#include "logger.h"
#include "utils.h"
#include <whisper.h>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <sstream>
#include <thread>

namespace parley {
namespace stt {

class WhisperRecognizer::Impl {
public:
    explicit Impl(const WhisperConfig& config)
        : config_(config), vad_(config.vad) {}

    ~Impl() {
        stop();
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    void start(EventCallback on_event) {
        if (config_.model_path.empty()) {
            throw ConfigurationError("recognition.model_path is not set");
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx_) {
            throw ConfigurationError("failed to load whisper model: " + config_.model_path);
        }

        on_event_ = std::move(on_event);
        stopping_ = false;
        worker_ = std::thread(&Impl::worker_loop, this);
        LOG_STT("Model loaded: " + config_.model_path);
    }

    void submit(const AudioData& audio) {
        if (!ctx_) return;

        PcmBuffer samples;
        try {
            ByteBuffer mono = audio.channels == 1 ? audio.bytes : convert::to_mono16(audio.bytes, audio.channels, 16);
            samples = convert::bytes_to_samples(mono);
            if (audio.sample_rate != WHISPER_SAMPLE_RATE) {
                samples = convert::resample(samples, audio.sample_rate, WHISPER_SAMPLE_RATE);
            }
        } catch (const MediaFormatError& e) {
            LOG_WARN(std::string("[STT] Skipping unreadable audio frame: ") + e.what());
            return;
        }

        vad::Event event = vad_.process(samples);
        if (event == vad::Event::SpeechStart) {
            RecognitionEvent started;
            started.kind = RecognitionEvent::Kind::SpeechStarted;
            on_event_(started);
        } else if (event == vad::Event::SpeechEnd) {
            PcmBuffer utterance = vad_.finalize_segment();
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push_back(std::move(utterance));
            cv_.notify_one();
        }
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return;
            stopping_ = true;
            cv_.notify_all();
        }
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    bool is_ready() const {
        return ctx_ != nullptr;
    }

private:
    void worker_loop() {
        while (true) {
            PcmBuffer utterance;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
                if (jobs_.empty()) return;
                utterance = std::move(jobs_.front());
                jobs_.pop_front();
            }

            RecognitionEvent result = transcribe(utterance);
            if (utils::is_blank_transcript(result.text)) {
                LOG_DEBUG("[STT] Dropping blank transcript: \"" + result.text + "\"");
                continue;
            }
            on_event_(result);
        }
    }

    RecognitionEvent transcribe(const PcmBuffer& segment) {
        RecognitionEvent result;
        result.kind = RecognitionEvent::Kind::Final;
        if (segment.empty()) {
            return result;
        }

        auto start = Clock::now();

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.n_threads = config_.threads;
        params.no_context = true;
        params.single_segment = true;

        std::vector<float> pcmf32(segment.size());
        for (size_t i = 0; i < segment.size(); i++) {
            pcmf32[i] = static_cast<float>(segment[i]) / 32768.0f;
        }

        int ret = whisper_full(ctx_, params, pcmf32.data(), static_cast<int>(pcmf32.size()));
        if (ret != 0) {
            LOG_WARN("[STT] whisper_full failed: " + std::to_string(ret));
            return result;
        }

        int n_segments = whisper_full_n_segments(ctx_);
        int total_tokens = 0;
        float total_prob = 0.0f;
        std::string text;
        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text(ctx_, i);
            int n_tokens = whisper_full_n_tokens(ctx_, i);
            total_tokens += n_tokens;
            for (int j = 0; j < n_tokens; j++) {
                total_prob += whisper_full_get_token_p(ctx_, i, j);
            }
        }

        result.text = utils::trim_copy(text);
        result.confidence = total_tokens > 0 ? (total_prob / total_tokens) : 0.0f;

        std::ostringstream oss;
        oss << "(" << ms_since(start) << "ms, p=" << result.confidence << ") " << result.text;
        LOG_STT(oss.str());
        return result;
    }

    WhisperConfig config_;
    vad::EnergyVAD vad_;
    whisper_context* ctx_ = nullptr;
    EventCallback on_event_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<PcmBuffer> jobs_;
    bool stopping_ = false;
    std::thread worker_;
};

WhisperRecognizer::WhisperRecognizer(const WhisperConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WhisperRecognizer::~WhisperRecognizer() = default;

void WhisperRecognizer::start(EventCallback on_event) {
    pimpl_->start(std::move(on_event));
}

void WhisperRecognizer::submit(const AudioData& audio) {
    pimpl_->submit(audio);
}

void WhisperRecognizer::stop() {
    pimpl_->stop();
}

bool WhisperRecognizer::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace stt
} // namespace parley
