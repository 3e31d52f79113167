#include "session/session.h"
#include "avatar/ws_avatar_service.h"
#include "errors.h"
#include "llm/openai_llm_client.h"
#include "logger.h"
#include "stages/avatar_stage.h"
#include "stages/context_stages.h"
#include "stages/llm_stage.h"
#include "stages/mixer_stage.h"
#include "stages/recognition_stage.h"
#include "stages/synthesis_stage.h"
#include "stages/transport_stages.h"
#include "stages/vision_stage.h"
#include "stt/whisper_recognizer.h"
#include "tts/ws_tts_client.h"
#include "vision/attach_policy.h"
#include <fstream>
#include <sstream>

namespace parley {

namespace {

/// Turns included in the end-of-call summary
constexpr size_t SUMMARY_TURNS = 10;

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Caller memory not readable: " + path);
        return "";
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

// =============================================================================
// SessionServices
// =============================================================================

SessionServices SessionServices::from_config(const config::SessionConfig& config) {
    config.require_credentials();

    SessionServices services;
    services.device = std::make_shared<AudioDevice>();
    services.reporter = std::make_shared<LogSessionReporter>();
    if (config.pipeline.audio_only) {
        return services;
    }

    stt::WhisperConfig whisper;
    whisper.model_path = config.recognition.model_path;
    whisper.language = config.recognition.language;
    whisper.threads = config.recognition.threads;
    whisper.vad.threshold = config.recognition.vad_threshold;
    whisper.vad.min_speech_ms = config.recognition.min_speech_ms;
    whisper.vad.end_silence_ms = config.recognition.end_silence_ms;
    whisper.vad.pre_speech_ms = config.recognition.pre_speech_ms;
    whisper.vad.max_speech_ms = config.recognition.max_speech_ms;
    services.recognizer = std::make_shared<stt::WhisperRecognizer>(whisper);

    llm::OpenAiConfig openai;
    openai.endpoint = config.llm.endpoint;
    openai.api_key = config.llm.api_key;
    openai.text_model = config.llm.text_model;
    openai.vision_model = config.llm.vision_model;
    openai.temperature = config.llm.temperature;
    openai.max_tokens = config.llm.max_tokens;
    openai.timeout_ms = config.llm.timeout_ms;
    services.language_model = std::make_shared<llm::OpenAiLlmClient>(openai);

    if (config.uses_synthesis()) {
        tts::WsTtsConfig tts;
        tts.host = config.tts.host;
        tts.port = config.tts.port;
        tts.path = config.tts.path;
        tts.api_base = config.tts.api_base;
        tts.api_key = config.tts.api_key;
        tts.version = config.tts.version;
        tts.model = config.tts.model;
        tts.voice_id = config.tts.voice_id;
        tts.default_voice_id = config.tts.default_voice_id;
        tts.language = config.recognition.language;
        tts.sample_rate = config.audio.sample_rate;
        services.synthesizer = std::make_shared<tts::WsTtsClient>(tts);
    }

    if (config.avatar.enabled) {
        WsAvatarEndpoint endpoint;
        endpoint.host = config.avatar.host;
        endpoint.port = config.avatar.port;
        endpoint.path = config.avatar.path;
        endpoint.api_key = config.avatar.api_key;
        endpoint.avatar_id = config.avatar.avatar_id;
        services.avatar = std::make_shared<WsAvatarService>(endpoint);
    }

    if (!config.tools.gateway_url.empty()) {
        ToolGatewayConfig gateway;
        gateway.url = config.tools.gateway_url;
        gateway.api_key = config.tools.api_key;
        gateway.timeout_ms = config.tools.timeout_ms;
        gateway.call_id = config.session.call_id;
        services.tools = std::make_shared<HttpToolGateway>(gateway);
    }

    return services;
}

// =============================================================================
// Session::Impl
// =============================================================================

class Session::Impl {
public:
    Impl(config::SessionConfig config, SessionServices services)
        : config_(std::move(config))
        , services_(std::move(services)) {
        if (!services_.device) {
            throw ConfigurationError("session needs an audio device");
        }
        if (!services_.reporter) {
            services_.reporter = std::make_shared<LogSessionReporter>();
        }
        build_context();
        build_chain();
    }

    pipeline::RunStatus run() {
        started_at_ = Clock::now();
        pipeline::RunStatus status = executor_->run();
        services_.reporter->report(summary(status));
        return status;
    }

    void stop() { executor_->stop(); }
    void cancel(const std::string& reason) { executor_->cancel(reason); }
    void queue_frame(Frame frame) { executor_->queue_frame(std::move(frame)); }

    std::vector<std::string> stage_names() const {
        std::vector<std::string> names;
        for (const auto& stage : stages_) {
            names.push_back(stage->name());
        }
        return names;
    }

    memory::ConversationContext& context() { return *context_; }
    const std::shared_ptr<AvatarFallbackController>& avatar() const { return avatar_; }
    pipeline::PipelineExecutor& executor() { return *executor_; }

    CallSummary summary(const pipeline::RunStatus& status) const {
        CallSummary summary;
        summary.call_id = config_.session.call_id;
        if (started_at_ != TimePoint()) {
            summary.duration_s = std::chrono::duration_cast<Seconds>(Clock::now() - started_at_).count();
        }
        summary.result = pipeline::run_status_name(status.kind);
        summary.detail = status.message;
        if (context_) {
            summary.final_turns = context_->recent_turns(SUMMARY_TURNS);
        }
        return summary;
    }

private:
    void build_context() {
        if (config_.pipeline.audio_only) {
            return;
        }

        memory::ContextOptions options;
        options.system_prompt = config_.memory.system_prompt;
        options.max_seed_messages = config_.memory.max_seed_messages;
        options.max_seed_chars = config_.memory.max_seed_chars;
        options.transcript_max_chars = config_.memory.transcript_max_chars;

        const SnapshotStore* snapshots = nullptr;
        std::unique_ptr<AttachPolicy> policy;
        std::shared_ptr<const JpegEncoder> encoder;
        if (config_.vision.enabled) {
            options.vision_prompt_suffix = config_.vision.prompt_suffix;
            snapshots = &snapshots_;
            AttachMode mode = parse_attach_mode(config_.vision.attach_mode).value_or(AttachMode::Always);
            policy = make_attach_policy(mode, config_.vision.max_age_s, config_.vision.keywords);
            encoder = std::make_shared<JpegEncoder>(config_.vision.jpeg_quality, config_.vision.max_dim);
        }

        context_ = std::make_unique<memory::ConversationContext>(
            std::move(options), std::move(policy), snapshots, std::move(encoder));
        context_->set_turn_observer([](MessageRole role, const std::string& rendered) {
            Logger::info(std::string("[Transcript] ") + role_name(role) + ": " + rendered);
        });

        if (!config_.memory.caller_memory_path.empty()) {
            size_t seeded = context_->seed_from_memory(read_file(config_.memory.caller_memory_path));
            LOG_CTX("Seeded " + std::to_string(seeded) + " messages from caller memory");
        }
    }

    void build_chain() {
        auto& cfg = config_;

        stages_.push_back(std::make_shared<stages::CaptureStage>(services_.device, cfg.audio));

        if (!cfg.pipeline.audio_only) {
            require(services_.recognizer, "speech recognizer");
            require(services_.language_model, "language model");

            if (cfg.avatar.enabled) {
                require(services_.avatar, "avatar service");
                AvatarOptions options;
                options.mode = parse_avatar_mode(cfg.avatar.mode).value_or(AvatarMode::Audio);
                options.output_sample_rate = cfg.avatar.output_sample_rate > 0
                    ? cfg.avatar.output_sample_rate : cfg.audio.sample_rate;
                options.video_fps = cfg.avatar.video_fps > 0 ? cfg.avatar.video_fps : cfg.vision.fps;
                avatar_ = std::make_shared<AvatarFallbackController>(services_.avatar, options);
            }

            if (cfg.vision.enabled) {
                stages_.push_back(std::make_shared<stages::VisionCaptureStage>(
                    snapshots_, cfg.vision.fps, avatar_ != nullptr));
            }
            stages_.push_back(std::make_shared<stages::RecognitionStage>(services_.recognizer));
            stages_.push_back(std::make_shared<stages::UserContextStage>(*context_, cfg.memory.greeting));

            stages::LlmStageOptions llm_options;
            llm_options.tools_json = cfg.tools.definitions_json == "[]" ? "" : cfg.tools.definitions_json;
            llm_options.max_tool_rounds = cfg.llm.max_tool_rounds;
            stages_.push_back(std::make_shared<stages::LlmStage>(
                *context_, services_.language_model, services_.tools, llm_options));

            if (cfg.text_avatar()) {
                stages_.push_back(std::make_shared<stages::AvatarStage>(avatar_));
                add_synthesis();
                add_mixer();
            } else {
                add_synthesis();
                add_mixer();
                if (avatar_) {
                    stages_.push_back(std::make_shared<stages::AvatarStage>(avatar_));
                }
            }

            stages_.push_back(std::make_shared<stages::AssistantContextStage>(*context_));
        }

        stages_.push_back(std::make_shared<stages::OutputStage>(services_.device));

        pipeline::ExecutorOptions options;
        options.queue_capacity = cfg.pipeline.queue_capacity;
        int idle_s = cfg.avatar.enabled ? cfg.pipeline.avatar_idle_timeout_s : cfg.pipeline.idle_timeout_s;
        options.idle_timeout = std::chrono::milliseconds(static_cast<int64_t>(idle_s) * 1000);
        executor_ = std::make_unique<pipeline::PipelineExecutor>(stages_, options);
    }

    void add_synthesis() {
        if (!config_.uses_synthesis()) {
            return;
        }
        require(services_.synthesizer, "speech synthesizer");

        BackoffPolicy backoff;
        backoff.initial_s = config_.tts.backoff_initial_s;
        backoff.max_s = config_.tts.backoff_max_s;
        backoff.max_attempts = config_.tts.max_attempts;

        stages::SynthesisStage::Bypass bypass;
        if (config_.text_avatar()) {
            std::shared_ptr<AvatarFallbackController> avatar = avatar_;
            bypass = [avatar]() { return avatar->active(); };
        }
        stages_.push_back(std::make_shared<stages::SynthesisStage>(
            services_.synthesizer, backoff.normalized(), std::move(bypass)));
    }

    void add_mixer() {
        const auto& bg = config_.background;
        if (bg.source.empty() || bg.gain <= 0.0f) {
            return;
        }
        if (config_.avatar.enabled && !bg.enabled_for_avatar) {
            LOG_INFO("Background mixing skipped for avatar session");
            return;
        }
        BackgroundTrackLoader loader = services_.background_fetcher
            ? BackgroundTrackLoader(bg.max_bytes, services_.background_fetcher)
            : BackgroundTrackLoader(bg.max_bytes);
        stages_.push_back(std::make_shared<stages::MixerStage>(
            std::move(loader), bg.source, config_.audio.sample_rate, bg.gain));
    }

    template<typename T>
    static void require(const std::shared_ptr<T>& service, const char* what) {
        if (!service) {
            throw ConfigurationError(std::string("session needs a ") + what);
        }
    }

    config::SessionConfig config_;
    SessionServices services_;
    SnapshotStore snapshots_;
    std::unique_ptr<memory::ConversationContext> context_;
    std::shared_ptr<AvatarFallbackController> avatar_;
    std::vector<std::shared_ptr<pipeline::Stage>> stages_;
    std::unique_ptr<pipeline::PipelineExecutor> executor_;
    TimePoint started_at_;
};

// =============================================================================
// Session Public Interface
// =============================================================================

Session::Session(config::SessionConfig config, SessionServices services)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(services))) {}

Session::~Session() = default;

pipeline::RunStatus Session::run() {
    return impl_->run();
}

void Session::stop() {
    impl_->stop();
}

void Session::cancel(const std::string& reason) {
    impl_->cancel(reason);
}

void Session::queue_frame(Frame frame) {
    impl_->queue_frame(std::move(frame));
}

std::vector<std::string> Session::stage_names() const {
    return impl_->stage_names();
}

memory::ConversationContext& Session::context() {
    return impl_->context();
}

const std::shared_ptr<AvatarFallbackController>& Session::avatar() const {
    return impl_->avatar();
}

pipeline::PipelineExecutor& Session::executor() {
    return impl_->executor();
}

CallSummary Session::summary(const pipeline::RunStatus& status) const {
    return impl_->summary(status);
}

} // namespace parley
