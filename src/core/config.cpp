/**
 * @file config.cpp
 * @brief Configuration loading and validation
 */

#include "core/config.h"
#include "errors.h"
#include "logger.h"
#include "vision/attach_policy.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace parley {
namespace config {

// =============================================================================
// JSON Serialization Helpers
// =============================================================================

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

template<typename T>
std::vector<T> get_array_or_default(const json& j, const std::string& key,
                                    const std::vector<T>& default_val) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<T>>();
    }
    return default_val;
}

AudioConfig parse_audio_config(const json& j) {
    AudioConfig config;
    if (!j.contains("audio")) return config;

    const auto& audio = j["audio"];
    config.input_device = get_or_default(audio, "input_device", config.input_device);
    config.output_device = get_or_default(audio, "output_device", config.output_device);
    config.sample_rate = get_or_default(audio, "sample_rate", config.sample_rate);
    config.frame_ms = get_or_default(audio, "frame_ms", config.frame_ms);
    return config;
}

PipelineConfig parse_pipeline_config(const json& j) {
    PipelineConfig config;
    if (!j.contains("pipeline")) return config;

    const auto& pipeline = j["pipeline"];
    config.queue_capacity = get_or_default(pipeline, "queue_capacity", config.queue_capacity);
    config.audio_only = get_or_default(pipeline, "audio_only", config.audio_only);
    config.idle_timeout_s = get_or_default(pipeline, "idle_timeout_s", config.idle_timeout_s);
    config.avatar_idle_timeout_s = get_or_default(pipeline, "avatar_idle_timeout_s",
                                                  config.avatar_idle_timeout_s);
    return config;
}

RecognitionConfig parse_recognition_config(const json& j) {
    RecognitionConfig config;
    if (!j.contains("recognition")) return config;

    const auto& stt = j["recognition"];
    config.model_path = get_or_default(stt, "model_path", config.model_path);
    config.language = get_or_default(stt, "language", config.language);
    config.threads = get_or_default(stt, "threads", config.threads);
    if (stt.contains("vad")) {
        const auto& vad = stt["vad"];
        config.vad_threshold = get_or_default(vad, "threshold", config.vad_threshold);
        config.min_speech_ms = get_or_default(vad, "min_speech_ms", config.min_speech_ms);
        config.end_silence_ms = get_or_default(vad, "end_silence_ms", config.end_silence_ms);
        config.pre_speech_ms = get_or_default(vad, "pre_speech_ms", config.pre_speech_ms);
        config.max_speech_ms = get_or_default(vad, "max_speech_ms", config.max_speech_ms);
    }
    return config;
}

LLMConfig parse_llm_config(const json& j) {
    LLMConfig config;
    if (!j.contains("llm")) return config;

    const auto& llm = j["llm"];
    config.endpoint = get_or_default(llm, "endpoint", config.endpoint);
    config.api_key = get_or_default(llm, "api_key", config.api_key);
    config.text_model = get_or_default(llm, "text_model", config.text_model);
    config.vision_model = get_or_default(llm, "vision_model", config.vision_model);
    config.temperature = get_or_default(llm, "temperature", config.temperature);
    config.max_tokens = get_or_default(llm, "max_tokens", config.max_tokens);
    config.timeout_ms = get_or_default(llm, "timeout_ms", config.timeout_ms);
    config.max_tool_rounds = get_or_default(llm, "max_tool_rounds", config.max_tool_rounds);
    return config;
}

TTSConfig parse_tts_config(const json& j) {
    TTSConfig config;
    if (!j.contains("tts")) return config;

    const auto& tts = j["tts"];
    config.host = get_or_default(tts, "host", config.host);
    config.port = get_or_default(tts, "port", config.port);
    config.path = get_or_default(tts, "path", config.path);
    config.api_base = get_or_default(tts, "api_base", config.api_base);
    config.api_key = get_or_default(tts, "api_key", config.api_key);
    config.version = get_or_default(tts, "version", config.version);
    config.model = get_or_default(tts, "model", config.model);
    config.voice_id = get_or_default(tts, "voice_id", config.voice_id);
    config.default_voice_id = get_or_default(tts, "default_voice_id", config.default_voice_id);
    config.backoff_initial_s = get_or_default(tts, "backoff_initial_s", config.backoff_initial_s);
    config.backoff_max_s = get_or_default(tts, "backoff_max_s", config.backoff_max_s);
    config.max_attempts = get_or_default(tts, "max_attempts", config.max_attempts);
    return config;
}

BackgroundConfig parse_background_config(const json& j) {
    BackgroundConfig config;
    if (!j.contains("background")) return config;

    const auto& bg = j["background"];
    config.source = get_or_default(bg, "source", config.source);
    config.gain = get_or_default(bg, "gain", config.gain);
    config.max_bytes = get_or_default(bg, "max_bytes", config.max_bytes);
    config.enabled_for_avatar = get_or_default(bg, "enabled_for_avatar", config.enabled_for_avatar);
    return config;
}

VisionConfig parse_vision_config(const json& j) {
    VisionConfig config;
    if (!j.contains("vision")) return config;

    const auto& vision = j["vision"];
    config.enabled = get_or_default(vision, "enabled", config.enabled);
    config.fps = get_or_default(vision, "fps", config.fps);
    config.max_age_s = get_or_default(vision, "max_age_s", config.max_age_s);
    config.attach_mode = get_or_default(vision, "attach_mode", config.attach_mode);
    config.max_dim = get_or_default(vision, "max_dim", config.max_dim);
    config.jpeg_quality = get_or_default(vision, "jpeg_quality", config.jpeg_quality);
    config.keywords = get_array_or_default<std::string>(vision, "keywords", config.keywords);
    config.prompt_suffix = get_or_default(vision, "prompt_suffix", config.prompt_suffix);
    return config;
}

AvatarConfig parse_avatar_config(const json& j) {
    AvatarConfig config;
    if (!j.contains("avatar")) return config;

    const auto& avatar = j["avatar"];
    config.enabled = get_or_default(avatar, "enabled", config.enabled);
    config.host = get_or_default(avatar, "host", config.host);
    config.port = get_or_default(avatar, "port", config.port);
    config.path = get_or_default(avatar, "path", config.path);
    config.api_key = get_or_default(avatar, "api_key", config.api_key);
    config.avatar_id = get_or_default(avatar, "avatar_id", config.avatar_id);
    config.mode = get_or_default(avatar, "mode", config.mode);
    config.output_sample_rate = get_or_default(avatar, "output_sample_rate", config.output_sample_rate);
    config.video_fps = get_or_default(avatar, "video_fps", config.video_fps);
    return config;
}

MemoryConfig parse_memory_config(const json& j) {
    MemoryConfig config;
    if (!j.contains("memory")) return config;

    const auto& memory = j["memory"];
    config.system_prompt = get_or_default(memory, "system_prompt", config.system_prompt);
    config.greeting = get_or_default(memory, "greeting", config.greeting);
    config.caller_memory_path = get_or_default(memory, "caller_memory_path", config.caller_memory_path);
    config.max_seed_messages = get_or_default(memory, "max_seed_messages", config.max_seed_messages);
    config.max_seed_chars = get_or_default(memory, "max_seed_chars", config.max_seed_chars);
    config.transcript_max_chars = get_or_default(memory, "transcript_max_chars",
                                                 config.transcript_max_chars);
    return config;
}

ToolsConfig parse_tools_config(const json& j) {
    ToolsConfig config;
    if (!j.contains("tools")) return config;

    const auto& tools = j["tools"];
    config.gateway_url = get_or_default(tools, "gateway_url", config.gateway_url);
    config.api_key = get_or_default(tools, "api_key", config.api_key);
    config.timeout_ms = get_or_default(tools, "timeout_ms", config.timeout_ms);
    if (tools.contains("definitions") && tools["definitions"].is_array()) {
        config.definitions_json = tools["definitions"].dump();
    }
    return config;
}

SessionInfo parse_session_info(const json& j) {
    SessionInfo info;
    if (!j.contains("session")) return info;

    const auto& session = j["session"];
    info.call_id = get_or_default(session, "call_id", info.call_id);
    info.is_video_meeting = get_or_default(session, "is_video_meeting", info.is_video_meeting);
    return info;
}

LoggingConfig parse_logging_config(const json& j) {
    LoggingConfig config;
    if (!j.contains("logging")) return config;

    const auto& logging = j["logging"];
    config.level = get_or_default(logging, "level", config.level);
    config.file = get_or_default(logging, "file", config.file);
    return config;
}

// -----------------------------------------------------------------------------
// Environment helpers
// -----------------------------------------------------------------------------

const char* lookup(const EnvLookup& env, const char* name) {
    const char* value = env ? env(name) : std::getenv(name);
    return (value && *value) ? value : nullptr;
}

void override_string(const EnvLookup& env, const char* name, std::string& target) {
    if (const char* value = lookup(env, name)) {
        target = value;
    }
}

void override_float(const EnvLookup& env, const char* name, float& target) {
    const char* value = lookup(env, name);
    if (!value) return;
    try {
        size_t used = 0;
        float parsed = std::stof(value, &used);
        if (used != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        target = parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + value);
    }
}

} // anonymous namespace

// =============================================================================
// SessionConfig Implementation
// =============================================================================

Result<SessionConfig> SessionConfig::parse(const std::string& json_text, const EnvLookup& env) {
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            return Result<SessionConfig>::failure("Config root must be a JSON object");
        }

        SessionConfig config;
        config.audio = parse_audio_config(j);
        config.pipeline = parse_pipeline_config(j);
        config.recognition = parse_recognition_config(j);
        config.llm = parse_llm_config(j);
        config.tts = parse_tts_config(j);
        config.background = parse_background_config(j);
        config.vision = parse_vision_config(j);
        config.avatar = parse_avatar_config(j);
        config.memory = parse_memory_config(j);
        config.tools = parse_tools_config(j);
        config.session = parse_session_info(j);
        config.logging = parse_logging_config(j);

        config.apply_env_overrides(env);
        config.normalize();

        std::string validation_error = config.validate();
        if (!validation_error.empty()) {
            return Result<SessionConfig>::failure("Config validation failed: " + validation_error);
        }
        return Result<SessionConfig>::success(std::move(config));

    } catch (const json::exception& e) {
        return Result<SessionConfig>::failure(std::string("JSON parse error: ") + e.what());
    }
}

Result<SessionConfig> SessionConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<SessionConfig>::failure("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto result = parse(buffer.str());
    if (result.ok()) {
        Logger::info("Configuration loaded from: " + path);
    }
    return result;
}

std::string SessionConfig::to_json() const {
    json j;

    j["audio"] = {
        {"input_device", audio.input_device},
        {"output_device", audio.output_device},
        {"sample_rate", audio.sample_rate},
        {"frame_ms", audio.frame_ms}
    };
    j["pipeline"] = {
        {"queue_capacity", pipeline.queue_capacity},
        {"audio_only", pipeline.audio_only},
        {"idle_timeout_s", pipeline.idle_timeout_s},
        {"avatar_idle_timeout_s", pipeline.avatar_idle_timeout_s}
    };
    j["recognition"] = {
        {"model_path", recognition.model_path},
        {"language", recognition.language},
        {"threads", recognition.threads},
        {"vad", {
            {"threshold", recognition.vad_threshold},
            {"min_speech_ms", recognition.min_speech_ms},
            {"end_silence_ms", recognition.end_silence_ms},
            {"pre_speech_ms", recognition.pre_speech_ms},
            {"max_speech_ms", recognition.max_speech_ms}
        }}
    };
    j["llm"] = {
        {"endpoint", llm.endpoint},
        {"api_key", llm.api_key},
        {"text_model", llm.text_model},
        {"vision_model", llm.vision_model},
        {"temperature", llm.temperature},
        {"max_tokens", llm.max_tokens},
        {"timeout_ms", llm.timeout_ms},
        {"max_tool_rounds", llm.max_tool_rounds}
    };
    j["tts"] = {
        {"host", tts.host},
        {"port", tts.port},
        {"path", tts.path},
        {"api_base", tts.api_base},
        {"api_key", tts.api_key},
        {"version", tts.version},
        {"model", tts.model},
        {"voice_id", tts.voice_id},
        {"default_voice_id", tts.default_voice_id},
        {"backoff_initial_s", tts.backoff_initial_s},
        {"backoff_max_s", tts.backoff_max_s},
        {"max_attempts", tts.max_attempts}
    };
    j["background"] = {
        {"source", background.source},
        {"gain", background.gain},
        {"max_bytes", background.max_bytes},
        {"enabled_for_avatar", background.enabled_for_avatar}
    };
    j["vision"] = {
        {"enabled", vision.enabled},
        {"fps", vision.fps},
        {"max_age_s", vision.max_age_s},
        {"attach_mode", vision.attach_mode},
        {"max_dim", vision.max_dim},
        {"jpeg_quality", vision.jpeg_quality},
        {"keywords", vision.keywords},
        {"prompt_suffix", vision.prompt_suffix}
    };
    j["avatar"] = {
        {"enabled", avatar.enabled},
        {"host", avatar.host},
        {"port", avatar.port},
        {"path", avatar.path},
        {"api_key", avatar.api_key},
        {"avatar_id", avatar.avatar_id},
        {"mode", avatar.mode},
        {"output_sample_rate", avatar.output_sample_rate},
        {"video_fps", avatar.video_fps}
    };
    j["memory"] = {
        {"system_prompt", memory.system_prompt},
        {"greeting", memory.greeting},
        {"caller_memory_path", memory.caller_memory_path},
        {"max_seed_messages", memory.max_seed_messages},
        {"max_seed_chars", memory.max_seed_chars},
        {"transcript_max_chars", memory.transcript_max_chars}
    };
    j["tools"] = {
        {"gateway_url", tools.gateway_url},
        {"api_key", tools.api_key},
        {"timeout_ms", tools.timeout_ms},
        {"definitions", json::parse(tools.definitions_json, nullptr, false)}
    };
    if (j["tools"]["definitions"].is_discarded()) {
        j["tools"]["definitions"] = json::array();
    }
    j["session"] = {
        {"call_id", session.call_id},
        {"is_video_meeting", session.is_video_meeting}
    };
    j["logging"] = {
        {"level", logging.level},
        {"file", logging.file}
    };

    return j.dump(2);
}

VoidResult SessionConfig::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return VoidResult::failure("Failed to open file for writing: " + path);
    }

    file << to_json();
    if (!file.good()) {
        return VoidResult::failure("Failed to write config: " + path);
    }
    Logger::info("Configuration saved to: " + path);
    return VoidResult::ok_result();
}

SessionConfig SessionConfig::defaults() {
    return SessionConfig{};  // All defaults are set in struct definitions
}

void SessionConfig::apply_env_overrides(const EnvLookup& env) {
    override_string(env, "PARLEY_LLM_API_KEY", llm.api_key);
    override_string(env, "PARLEY_LLM_ENDPOINT", llm.endpoint);
    override_string(env, "PARLEY_TTS_API_KEY", tts.api_key);
    override_string(env, "PARLEY_TTS_VOICE_ID", tts.voice_id);
    override_string(env, "PARLEY_AVATAR_API_KEY", avatar.api_key);
    override_string(env, "PARLEY_BACKGROUND_SOURCE", background.source);
    override_float(env, "PARLEY_BACKGROUND_GAIN", background.gain);
    override_string(env, "PARLEY_VISION_ATTACH_MODE", vision.attach_mode);
    override_string(env, "PARLEY_CALL_ID", session.call_id);
    override_string(env, "PARLEY_LOG_LEVEL", logging.level);
}

void SessionConfig::normalize() {
    namespace cv = constants::vision;

    vision.fps = std::max(1, vision.fps);
    vision.max_age_s = std::clamp(vision.max_age_s, 0.0, cv::MAX_AGE_LIMIT_S);
    vision.max_dim = std::clamp(vision.max_dim, 0, cv::MAX_DIM_LIMIT);
    vision.jpeg_quality = std::clamp(vision.jpeg_quality, cv::MIN_JPEG_QUALITY, cv::MAX_JPEG_QUALITY);

    tts.backoff_initial_s = std::max(constants::backoff::MIN_INITIAL_S, tts.backoff_initial_s);
    tts.backoff_max_s = std::max(tts.backoff_initial_s, tts.backoff_max_s);
    tts.max_attempts = std::max(1, tts.max_attempts);

    if (avatar.output_sample_rate <= 0) avatar.output_sample_rate = audio.sample_rate;
    if (avatar.video_fps <= 0) avatar.video_fps = vision.fps;

    background.gain = std::max(0.0f, background.gain);
    llm.max_tool_rounds = std::max(0, llm.max_tool_rounds);
}

std::string SessionConfig::validate() const {
    std::ostringstream errors;

    if (audio.sample_rate < 8000 || audio.sample_rate > 48000) {
        errors << "audio.sample_rate must be between 8000 and 48000; ";
    }
    if (audio.frame_ms <= 0 || audio.frame_ms > 200) {
        errors << "audio.frame_ms must be between 1 and 200; ";
    }
    if (pipeline.queue_capacity == 0) {
        errors << "pipeline.queue_capacity must be positive; ";
    }

    if (!pipeline.audio_only) {
        if (recognition.model_path.empty()) {
            errors << "recognition.model_path is required; ";
        }
        if (recognition.vad_threshold <= 0 || recognition.vad_threshold > 1.0f) {
            errors << "recognition.vad.threshold must be between 0 and 1; ";
        }
        if (llm.endpoint.empty()) {
            errors << "llm.endpoint is required; ";
        }
    }

    if (!parse_attach_mode(vision.attach_mode)) {
        errors << "vision.attach_mode must be always, auto or never; ";
    }
    if (avatar.mode != "audio" && avatar.mode != "text") {
        errors << "avatar.mode must be audio or text; ";
    }
    if (avatar.enabled && avatar.host.empty()) {
        errors << "avatar.host is required when the avatar is enabled; ";
    }
    if (!json::accept(tools.definitions_json) || !json::parse(tools.definitions_json).is_array()) {
        errors << "tools.definitions must be an array; ";
    }
    // An unknown name is the only input for which the fallback shows through
    if (parse_log_level(logging.level, LogLevel::DEBUG) != parse_log_level(logging.level, LogLevel::ERROR)) {
        errors << "logging.level must be debug, info, warn or error; ";
    }

    return errors.str();
}

void SessionConfig::require_credentials() const {
    if (pipeline.audio_only) return;

    if (llm.api_key.empty()) {
        throw ConfigurationError("llm.api_key is not set (PARLEY_LLM_API_KEY)");
    }
    if (!text_avatar() && tts.api_key.empty()) {
        throw ConfigurationError("tts.api_key is not set (PARLEY_TTS_API_KEY)");
    }
    if (avatar.enabled && avatar.api_key.empty()) {
        throw ConfigurationError("avatar.api_key is not set (PARLEY_AVATAR_API_KEY)");
    }
}

bool SessionConfig::uses_synthesis() const {
    if (pipeline.audio_only) return false;
    return !text_avatar() || !tts.api_key.empty();
}

} // namespace config
} // namespace parley
