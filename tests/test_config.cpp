/**
 * Configuration and session assembly tests.
 * Asserts:
 * - Missing keys fall back to defaults; PARLEY_* variables override the file.
 * - Invalid numeric overrides are ignored; tunables are clamped into range.
 * - validate() names every bad field; require_credentials() names the first missing key.
 * - The session builds stages in canonical order for voice, avatar and
 *   audio_only profiles, and refuses to start without required services.
 *
 * Run from build dir: ./test_config
 */

#include "core/config.h"
#include "errors.h"
#include "session/session.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace parley;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

config::EnvLookup env_from(const std::map<std::string, std::string>& vars) {
    return [&vars](const char* name) -> const char* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

class IdleRecognizer : public stt::ISpeechRecognizer {
public:
    void start(stt::EventCallback) override {}
    void submit(const AudioData&) override {}
    void stop() override {}
    bool is_ready() const override { return true; }
};

class IdleModel : public llm::ILanguageModel {
public:
    llm::Completion complete(const std::vector<memory::ContextMessage>&,
                             const std::string&,
                             const llm::TokenCallback&) override {
        return llm::Completion();
    }
    void abort() override {}
};

class IdleSynth : public tts::ISpeechSynthesizer {
public:
    ConnectionState connection_state() const override { return ConnectionState::Open; }
    void connect() override {}
    std::string connection_name() const override { return "idle-tts"; }
    void speak(const std::string&, const tts::AudioCallback&) override {}
    void cancel() override {}
    void close() override {}
    int sample_rate() const override { return audio::SAMPLE_RATE; }
};

class IdleAvatar : public AvatarService {
public:
    void start() override {}
    void stop() override {}
    bool is_connected() const override { return false; }
    bool sender_alive() const override { return false; }
    void send_text(const std::string&) override {}
    void send_audio(const AudioData&) override {}
    void send_end_of_speech() override {}
    void send_image(const ImageData&) override {}
    void interrupt() override {}
    std::optional<AvatarAudioChunk> read_audio() override { return std::nullopt; }
    std::optional<AvatarVideoFrame> read_video() override { return std::nullopt; }
    std::string name() const override { return "idle-avatar"; }
};

SessionServices fake_services() {
    SessionServices services;
    services.device = std::make_shared<AudioDevice>();
    services.recognizer = std::make_shared<IdleRecognizer>();
    services.language_model = std::make_shared<IdleModel>();
    services.synthesizer = std::make_shared<IdleSynth>();
    services.avatar = std::make_shared<IdleAvatar>();
    services.reporter = std::make_shared<LogSessionReporter>();
    return services;
}

config::SessionConfig voice_config() {
    config::SessionConfig cfg = config::SessionConfig::defaults();
    cfg.llm.api_key = "sk-test";
    cfg.tts.api_key = "tts-test";
    return cfg;
}

using Names = std::vector<std::string>;

} // namespace

int main() {
    const std::map<std::string, std::string> no_vars;

    // --- defaults ---
    {
        auto result = config::SessionConfig::parse("{}", env_from(no_vars));
        ASSERT(result.ok());
        const auto& cfg = *result.value;
        ASSERT(cfg.audio.sample_rate == 16000);
        ASSERT(cfg.llm.text_model == "grok-3");
        ASSERT(cfg.llm.vision_model == "grok-4");
        ASSERT(cfg.tts.max_attempts == 6);
        ASSERT(cfg.vision.attach_mode == "always");
        ASSERT(!cfg.avatar.enabled && cfg.avatar.mode == "audio");
        ASSERT(cfg.avatar.output_sample_rate == cfg.audio.sample_rate);
        ASSERT(cfg.avatar.video_fps == cfg.vision.fps);
        ASSERT(cfg.tools.definitions_json == "[]");
        ASSERT(cfg.pipeline.idle_timeout_s == 300);
        ASSERT(cfg.pipeline.avatar_idle_timeout_s == 1800);
    }

    // --- file values and environment overrides ---
    {
        json doc = {
            {"llm", {{"api_key", "sk-file"}, {"text_model", "grok-3-mini"}, {"max_tool_rounds", 2}}},
            {"background", {{"source", "https://cdn.test/bed.wav"}, {"gain", 0.1}}},
            {"vision", {{"enabled", true}, {"keywords", json::array({"shirt", "screen"})}}},
            {"tools", {{"gateway_url", "https://tools.test/run"},
                       {"definitions", json::array({{{"type", "function"},
                                                     {"function", {{"name", "transfer_call"}}}}})}}},
            {"recognition", {{"vad", {{"threshold", 0.05}, {"end_silence_ms", 700}}}}},
            {"session", {{"call_id", "file-call"}}}
        };
        std::map<std::string, std::string> vars = {
            {"PARLEY_LLM_API_KEY", "sk-env"},
            {"PARLEY_VISION_ATTACH_MODE", "auto"},
            {"PARLEY_BACKGROUND_GAIN", "loud"},
            {"PARLEY_CALL_ID", ""},
            {"PARLEY_LOG_LEVEL", "debug"}
        };
        auto result = config::SessionConfig::parse(doc.dump(), env_from(vars));
        ASSERT(result.ok());
        const auto& cfg = *result.value;
        ASSERT(cfg.llm.api_key == "sk-env");
        ASSERT(cfg.llm.text_model == "grok-3-mini");
        ASSERT(cfg.llm.max_tool_rounds == 2);
        ASSERT(cfg.vision.enabled && cfg.vision.attach_mode == "auto");
        ASSERT(cfg.vision.keywords == std::vector<std::string>({"shirt", "screen"}));
        ASSERT(cfg.background.gain > 0.099f && cfg.background.gain < 0.101f);  // invalid override ignored
        ASSERT(cfg.session.call_id == "file-call");                            // empty override ignored
        ASSERT(cfg.logging.level == "debug");
        ASSERT(contains(cfg.tools.definitions_json, "transfer_call"));
        ASSERT(cfg.recognition.vad_threshold > 0.049f && cfg.recognition.vad_threshold < 0.051f);
        ASSERT(cfg.recognition.end_silence_ms == 700);

        std::map<std::string, std::string> gain_var = {{"PARLEY_BACKGROUND_GAIN", "0.25"}};
        auto with_gain = config::SessionConfig::parse(doc.dump(), env_from(gain_var));
        ASSERT(with_gain.ok() && with_gain.value->background.gain == 0.25f);
    }

    // --- clamping ---
    {
        config::SessionConfig cfg;
        cfg.vision.fps = 0;
        cfg.vision.max_age_s = 500.0;
        cfg.vision.max_dim = 99999;
        cfg.vision.jpeg_quality = 5;
        cfg.tts.backoff_initial_s = 0.0;
        cfg.tts.backoff_max_s = 0.0;
        cfg.tts.max_attempts = 0;
        cfg.background.gain = -1.0f;
        cfg.llm.max_tool_rounds = -3;
        cfg.normalize();
        ASSERT(cfg.vision.fps == 1);
        ASSERT(cfg.vision.max_age_s == 60.0);
        ASSERT(cfg.vision.max_dim == 2048);
        ASSERT(cfg.vision.jpeg_quality == 30);
        ASSERT(cfg.tts.backoff_initial_s == 0.1);
        ASSERT(cfg.tts.backoff_max_s >= cfg.tts.backoff_initial_s);
        ASSERT(cfg.tts.max_attempts == 1);
        ASSERT(cfg.background.gain == 0.0f);
        ASSERT(cfg.llm.max_tool_rounds == 0);
    }

    // --- validation ---
    {
        config::SessionConfig cfg;
        ASSERT(cfg.validate().empty());

        cfg.vision.attach_mode = "sometimes";
        cfg.avatar.mode = "video";
        cfg.avatar.enabled = true;
        cfg.tools.definitions_json = "{\"name\":\"x\"}";
        cfg.logging.level = "chatty";
        cfg.audio.sample_rate = 1000;
        std::string errors = cfg.validate();
        ASSERT(contains(errors, "vision.attach_mode"));
        ASSERT(contains(errors, "avatar.mode"));
        ASSERT(contains(errors, "avatar.host"));
        ASSERT(contains(errors, "tools.definitions"));
        ASSERT(contains(errors, "logging.level"));
        ASSERT(contains(errors, "audio.sample_rate"));

        config::SessionConfig bare;
        bare.pipeline.audio_only = true;
        bare.recognition.model_path.clear();
        bare.llm.endpoint.clear();
        ASSERT(bare.validate().empty());
        bare.pipeline.audio_only = false;
        ASSERT(contains(bare.validate(), "recognition.model_path"));
        ASSERT(contains(bare.validate(), "llm.endpoint"));
    }
    {
        auto bad_mode = config::SessionConfig::parse("{\"vision\": {\"attach_mode\": \"maybe\"}}",
                                                     env_from(no_vars));
        ASSERT(bad_mode.failed());
        ASSERT(contains(bad_mode.error, "attach_mode"));

        auto not_object = config::SessionConfig::parse("[1, 2]", env_from(no_vars));
        ASSERT(not_object.failed());

        auto malformed = config::SessionConfig::parse("{\"llm\": ", env_from(no_vars));
        ASSERT(malformed.failed());
        ASSERT(contains(malformed.error, "JSON parse error"));

        auto wrong_type = config::SessionConfig::parse("{\"audio\": {\"sample_rate\": \"fast\"}}",
                                                       env_from(no_vars));
        ASSERT(wrong_type.failed());

        auto missing = config::SessionConfig::load("/nonexistent/parley.json");
        ASSERT(missing.failed());
    }

    // --- save and load ---
    {
        config::SessionConfig cfg = voice_config();
        cfg.session.call_id = "saved-call";
        cfg.vision.keywords = {"badge"};
        const std::string path = "test_config_roundtrip.json";
        ASSERT(cfg.save(path).ok());
        auto loaded = config::SessionConfig::load(path);
        ASSERT(loaded.ok());
        if (loaded.ok()) {
            ASSERT(loaded.value->session.call_id == "saved-call" ||
                   std::getenv("PARLEY_CALL_ID") != nullptr);
            ASSERT(loaded.value->vision.keywords == std::vector<std::string>({"badge"}));
            ASSERT(loaded.value->tools.definitions_json == "[]");
        }
        std::remove(path.c_str());
    }

    // --- credentials ---
    {
        config::SessionConfig cfg;
        bool threw = false;
        try {
            cfg.require_credentials();
        } catch (const ConfigurationError& e) {
            threw = contains(e.what(), "llm.api_key");
        }
        ASSERT(threw);

        cfg.llm.api_key = "sk";
        threw = false;
        try {
            cfg.require_credentials();
        } catch (const ConfigurationError& e) {
            threw = contains(e.what(), "tts.api_key");
        }
        ASSERT(threw);

        // A text-driven avatar speaks for itself; synthesis is optional
        cfg.avatar.enabled = true;
        cfg.avatar.mode = "text";
        cfg.avatar.api_key = "av";
        cfg.require_credentials();
        ASSERT(cfg.text_avatar());
        ASSERT(!cfg.uses_synthesis());
        cfg.tts.api_key = "tts";
        ASSERT(cfg.uses_synthesis());

        config::SessionConfig audio_only;
        audio_only.pipeline.audio_only = true;
        audio_only.require_credentials();
        ASSERT(!audio_only.uses_synthesis());
    }

    // =========================================================================
    // Session assembly
    // =========================================================================
    {
        Session session(voice_config(), fake_services());
        ASSERT(session.stage_names() == Names({"capture", "recognition", "user-context", "llm",
                                               "synthesis", "assistant-context", "output"}));
        ASSERT(!session.avatar());
        ASSERT(session.executor().stage_count() == 7);
        ASSERT(session.context().size() == 1);  // system prompt
    }
    {
        config::SessionConfig cfg = voice_config();
        cfg.vision.enabled = true;
        cfg.background.source = "bed.wav";
        cfg.background.gain = 0.1f;
        Session session(cfg, fake_services());
        ASSERT(session.stage_names() == Names({"capture", "vision", "recognition", "user-context", "llm",
                                               "synthesis", "mixer", "assistant-context", "output"}));
        auto messages = session.context().snapshot();
        ASSERT(!messages.empty() && contains(messages[0].content, "camera"));
    }
    {
        // Audio-driven avatar after synthesis; background skipped unless enabled for avatars
        config::SessionConfig cfg = voice_config();
        cfg.avatar.enabled = true;
        cfg.avatar.host = "avatar.test";
        cfg.background.source = "bed.wav";
        cfg.background.gain = 0.1f;
        Session session(cfg, fake_services());
        ASSERT(session.stage_names() == Names({"capture", "recognition", "user-context", "llm",
                                               "synthesis", "avatar", "assistant-context", "output"}));
        ASSERT(session.avatar() != nullptr);

        cfg.background.enabled_for_avatar = true;
        Session mixed(cfg, fake_services());
        ASSERT(mixed.stage_names() == Names({"capture", "recognition", "user-context", "llm",
                                             "synthesis", "mixer", "avatar", "assistant-context", "output"}));
    }
    {
        // Text-driven avatar in front of synthesis; synthesis only with a TTS key
        config::SessionConfig cfg = voice_config();
        cfg.avatar.enabled = true;
        cfg.avatar.host = "avatar.test";
        cfg.avatar.mode = "text";
        Session with_tts(cfg, fake_services());
        ASSERT(with_tts.stage_names() == Names({"capture", "recognition", "user-context", "llm",
                                                "avatar", "synthesis", "assistant-context", "output"}));

        cfg.tts.api_key.clear();
        SessionServices services = fake_services();
        services.synthesizer.reset();
        Session avatar_only(cfg, services);
        ASSERT(avatar_only.stage_names() == Names({"capture", "recognition", "user-context", "llm",
                                                   "avatar", "assistant-context", "output"}));
    }
    {
        config::SessionConfig cfg;
        cfg.pipeline.audio_only = true;
        SessionServices services;
        services.device = std::make_shared<AudioDevice>();
        Session session(cfg, services);
        ASSERT(session.stage_names() == Names({"capture", "output"}));
    }
    {
        // Required services
        SessionServices no_model = fake_services();
        no_model.language_model.reset();
        bool threw = false;
        try {
            Session session(voice_config(), no_model);
        } catch (const ConfigurationError& e) {
            threw = contains(e.what(), "language model");
        }
        ASSERT(threw);

        SessionServices no_device = fake_services();
        no_device.device.reset();
        threw = false;
        try {
            Session session(voice_config(), no_device);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        ASSERT(threw);

        config::SessionConfig cfg = voice_config();
        cfg.avatar.enabled = true;
        cfg.avatar.host = "avatar.test";
        SessionServices no_avatar = fake_services();
        no_avatar.avatar.reset();
        threw = false;
        try {
            Session session(cfg, no_avatar);
        } catch (const ConfigurationError& e) {
            threw = contains(e.what(), "avatar");
        }
        ASSERT(threw);
    }
    {
        // Caller memory seeds the context behind the system prompt
        const std::string path = "test_config_memory.json";
        {
            std::FILE* f = std::fopen(path.c_str(), "w");
            ASSERT(f != nullptr);
            if (f) {
                std::fputs("{\"messages\": [{\"role\": \"user\", \"content\": \"I called yesterday\"}]}", f);
                std::fclose(f);
            }
        }
        config::SessionConfig cfg = voice_config();
        cfg.memory.caller_memory_path = path;
        cfg.session.call_id = "call-42";
        Session session(cfg, fake_services());
        auto messages = session.context().snapshot();
        ASSERT(messages.size() == 3);
        if (messages.size() == 3) {
            ASSERT(messages[2].content == "I called yesterday");
        }

        pipeline::RunStatus status;
        status.kind = pipeline::RunStatus::Kind::Cancelled;
        status.message = "caller hung up";
        CallSummary summary = session.summary(status);
        ASSERT(summary.call_id == "call-42");
        ASSERT(summary.result == "cancelled");
        ASSERT(summary.detail == "caller hung up");
        ASSERT(summary.final_turns.size() == 1);
        std::remove(path.c_str());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
