#pragma once

/**
 * @file session.h
 * @brief One live call: services, conversation context and the stage chain
 */

#include "audio/audio_io.h"
#include "audio/track_loader.h"
#include "avatar/avatar_fallback_controller.h"
#include "core/config.h"
#include "llm/language_model.h"
#include "memory/conversation_context.h"
#include "pipeline/pipeline_executor.h"
#include "session/session_reporter.h"
#include "stt/speech_recognizer.h"
#include "tools/tool_gateway.h"
#include "tts/speech_synthesizer.h"
#include <memory>
#include <string>
#include <vector>

namespace parley {

/**
 * @brief External collaborators of a session
 *
 * Null members are allowed wherever the configuration does not need the
 * service (no avatar, no tools, audio_only).
 */
struct SessionServices {
    std::shared_ptr<AudioDevice> device;
    std::shared_ptr<stt::ISpeechRecognizer> recognizer;
    std::shared_ptr<llm::ILanguageModel> language_model;
    std::shared_ptr<tts::ISpeechSynthesizer> synthesizer;
    std::shared_ptr<AvatarService> avatar;
    std::shared_ptr<IToolGateway> tools;
    std::shared_ptr<ISessionReporter> reporter;

    /// Background track fetcher (null = https/file fetch)
    BackgroundTrackLoader::Fetcher background_fetcher;

    /**
     * @brief Concrete services for a validated configuration
     * @throws ConfigurationError if a required credential is missing
     */
    static SessionServices from_config(const config::SessionConfig& config);
};

/**
 * @brief Builds the stage chain in canonical order and runs it once
 *
 * Canonical order: capture, vision capture, recognition, user context,
 * language model, synthesis, mixer, avatar, assistant context, output.
 * A text-driven avatar moves in front of synthesis, which then only
 * speaks while the avatar is degraded. audio_only runs capture -> output.
 */
class Session {
public:
    Session(config::SessionConfig config, SessionServices services);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Run until the call ends, then report the call summary
     */
    pipeline::RunStatus run();

    /// Graceful: drain in-flight work, then end
    void stop();

    void cancel(const std::string& reason = "cancelled");

    /// Inject a frame at the head of the pipeline (transport events, tests)
    void queue_frame(Frame frame);

    std::vector<std::string> stage_names() const;

    memory::ConversationContext& context();
    const std::shared_ptr<AvatarFallbackController>& avatar() const;
    pipeline::PipelineExecutor& executor();

    /// Summary of the call so far
    CallSummary summary(const pipeline::RunStatus& status) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley
