#pragma once

/**
 * @file config.h
 * @brief Session configuration
 *
 * Supports:
 * - JSON file loading
 * - Environment variable overrides (PARLEY_*)
 * - Default values
 * - Range clamping and validation
 */

#include "types.h"
#include "constants.h"
#include <functional>
#include <string>
#include <vector>

namespace parley {
namespace config {

// =============================================================================
// Component Configurations
// =============================================================================

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    int sample_rate = audio::SAMPLE_RATE;
    int frame_ms = audio::FRAME_DURATION_MS;
};

struct PipelineConfig {
    size_t queue_capacity = constants::pipeline::DEFAULT_QUEUE_CAPACITY;
    bool audio_only = false;   ///< capture -> output only
    int idle_timeout_s = constants::pipeline::IDLE_TIMEOUT_S;
    int avatar_idle_timeout_s = constants::pipeline::AVATAR_IDLE_TIMEOUT_S;
};

/**
 * @brief Speech recognition (whisper + energy VAD)
 */
struct RecognitionConfig {
    std::string model_path = "models/ggml-base.en.bin";
    std::string language = "en";
    int threads = 4;

    float vad_threshold = constants::vad::DEFAULT_THRESHOLD;
    int min_speech_ms = constants::vad::MIN_SPEECH_MS;
    int end_silence_ms = constants::vad::END_SILENCE_MS;
    int pre_speech_ms = constants::vad::PRE_SPEECH_MS;
    int max_speech_ms = constants::vad::MAX_SPEECH_MS;
};

struct LLMConfig {
    std::string endpoint = "https://api.x.ai/v1/chat/completions";
    std::string api_key;
    std::string text_model = "grok-3";
    std::string vision_model = "grok-4";
    float temperature = constants::llm::DEFAULT_TEMPERATURE;
    int max_tokens = constants::llm::DEFAULT_MAX_TOKENS;
    int timeout_ms = constants::llm::DEFAULT_TIMEOUT_MS;
    int max_tool_rounds = constants::llm::MAX_TOOL_ROUNDS;
};

struct TTSConfig {
    std::string host = "api.cartesia.ai";
    std::string port = "443";
    std::string path = "/tts/websocket";
    std::string api_base = "https://api.cartesia.ai";
    std::string api_key;
    std::string version = "2025-04-16";
    std::string model = "sonic-3";
    std::string voice_id;
    std::string default_voice_id;

    double backoff_initial_s = constants::backoff::INITIAL_S;
    double backoff_max_s = constants::backoff::MAX_S;
    int max_attempts = constants::backoff::MAX_ATTEMPTS;
};

struct BackgroundConfig {
    std::string source;          ///< https URL or local path; empty = no mixing
    float gain = constants::mixer::DEFAULT_GAIN;
    size_t max_bytes = constants::mixer::MAX_TRACK_BYTES;
    bool enabled_for_avatar = false;
};

struct VisionConfig {
    bool enabled = false;
    int fps = constants::vision::DEFAULT_FPS;
    double max_age_s = constants::vision::DEFAULT_MAX_AGE_S;
    std::string attach_mode = "always";
    int max_dim = constants::vision::DEFAULT_MAX_DIM;
    int jpeg_quality = constants::vision::DEFAULT_JPEG_QUALITY;
    std::vector<std::string> keywords;   ///< Empty = built-in list
    std::string prompt_suffix =
        "You can see the participant through their camera. When a user message "
        "includes an image, it is a current frame from that camera. Describe only "
        "what is actually visible and say so when the image is unclear.";
};

struct AvatarConfig {
    bool enabled = false;
    std::string host;
    std::string port = "443";
    std::string path = "/v1/stream";
    std::string api_key;
    std::string avatar_id;
    std::string mode = "audio";
    int output_sample_rate = 0;   ///< 0 = audio.sample_rate
    int video_fps = 0;            ///< 0 = vision.fps
};

struct MemoryConfig {
    std::string system_prompt = "You are a friendly voice assistant on a live call. "
                                "Keep answers short and conversational. "
                                "Do not use markdown or lists.";
    std::string greeting;
    std::string caller_memory_path;
    size_t max_seed_messages = constants::memory::MAX_SEED_MESSAGES;
    size_t max_seed_chars = constants::memory::MAX_SEED_CHARS;
    size_t transcript_max_chars = constants::memory::TRANSCRIPT_MAX_CHARS;
};

/**
 * @brief Tool gateway; tools are disabled while gateway_url is empty
 */
struct ToolsConfig {
    std::string gateway_url;
    std::string api_key;
    int timeout_ms = 15000;
    std::string definitions_json = "[]";   ///< OpenAI-style tool schemas
};

struct SessionInfo {
    std::string call_id;
    bool is_video_meeting = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

// =============================================================================
// Main Configuration
// =============================================================================

/// Environment lookup; returns nullptr for unset variables
using EnvLookup = std::function<const char*(const char* name)>;

/**
 * @brief Complete session configuration
 */
struct SessionConfig {
    AudioConfig audio;
    PipelineConfig pipeline;
    RecognitionConfig recognition;
    LLMConfig llm;
    TTSConfig tts;
    BackgroundConfig background;
    VisionConfig vision;
    AvatarConfig avatar;
    MemoryConfig memory;
    ToolsConfig tools;
    SessionInfo session;
    LoggingConfig logging;

    /**
     * @brief Load from a JSON file, then apply env overrides, clamp and validate
     * @return Loaded config or error
     */
    static Result<SessionConfig> load(const std::string& path);

    /// Same as load() for JSON text already in memory
    static Result<SessionConfig> parse(const std::string& json_text,
                                       const EnvLookup& env = nullptr);

    /**
     * @brief Save configuration to JSON file
     */
    VoidResult save(const std::string& path) const;

    std::string to_json() const;

    /**
     * @brief Runnable local profile
     */
    static SessionConfig defaults();

    /**
     * @brief Apply PARLEY_* environment overrides
     *
     * Invalid numbers are ignored with a warning and the file value is kept.
     */
    void apply_env_overrides(const EnvLookup& env = nullptr);

    /// Clamp tunables into their supported ranges
    void normalize();

    /**
     * @brief Validate configuration
     * @return Error message if invalid, empty if valid
     */
    std::string validate() const;

    /**
     * @brief Check that every enabled service has its credentials
     * @throws ConfigurationError naming the first missing key
     */
    void require_credentials() const;

    /// The avatar renders from text and replaces local synthesis
    bool text_avatar() const { return avatar.enabled && avatar.mode == "text"; }

    /// Whether a synthesis stage is part of the chain
    bool uses_synthesis() const;
};

} // namespace config

// Convenience alias
using Config = config::SessionConfig;

} // namespace parley
