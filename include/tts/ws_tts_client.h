#pragma once

/**
 * @file ws_tts_client.h
 * @brief WebSocket streaming synthesizer (raw PCM16 chunks, base64 in JSON)
 */

#include "core/process_cache.h"
#include "tts/speech_synthesizer.h"
#include <memory>
#include <optional>
#include <string>

namespace parley {
namespace tts {

struct WsTtsConfig {
    std::string host = "api.cartesia.ai";
    std::string port = "443";
    std::string path = "/tts/websocket";
    std::string api_base = "https://api.cartesia.ai";
    std::string api_key;
    std::string version = "2025-04-16";
    std::string model = "sonic-3";
    std::string voice_id;
    std::string default_voice_id;
    std::string language = "en";
    int sample_rate = audio::SAMPLE_RATE;
};

/// One inbound synthesis message, decoded
struct TtsMessage {
    std::string type;
    std::string context_id;
    ByteBuffer audio;       ///< Decoded PCM16 of a "chunk" message
    std::string error;      ///< Error body of an "error" message
    bool done = false;      ///< The context has no more audio
};

/**
 * @brief Decode one inbound message
 * @return nullopt for anything that is not a JSON object with the
 *         expected field types
 */
std::optional<TtsMessage> decode_tts_message(const std::string& raw);

class WsTtsClient : public ISpeechSynthesizer {
public:
    explicit WsTtsClient(const WsTtsConfig& config);
    ~WsTtsClient() override;

    // Non-copyable
    WsTtsClient(const WsTtsClient&) = delete;
    WsTtsClient& operator=(const WsTtsClient&) = delete;

    // Connectable
    ConnectionState connection_state() const override;
    void connect() override;
    std::string connection_name() const override { return "tts"; }

    // ISpeechSynthesizer
    void speak(const std::string& text, const AudioCallback& on_audio) override;
    void cancel() override;
    void close() override;
    int sample_rate() const override;

    /**
     * @brief Voice to synthesize with
     *
     * Configured voice, then the default voice, then the first voice the
     * service lists. The listed voice is cached per API base for the
     * process lifetime.
     */
    std::string resolve_voice() const;

    static ProcessCache<std::string, std::string>& voice_cache();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace tts
} // namespace parley
