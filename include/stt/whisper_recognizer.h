#pragma once

/**
 * @file whisper_recognizer.h
 * @brief whisper.cpp recognizer segmented by an energy VAD
 */

#include "stt/speech_recognizer.h"
#include "vad/energy_vad.h"
#include <memory>
#include <string>

namespace parley {
namespace stt {

struct WhisperConfig {
    std::string model_path;
    std::string language = "en";
    int threads = 4;
    bool use_gpu = true;
    vad::EnergyVADConfig vad;
};

class WhisperRecognizer : public ISpeechRecognizer {
public:
    explicit WhisperRecognizer(const WhisperConfig& config);
    ~WhisperRecognizer() override;

    // Non-copyable
    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    void start(EventCallback on_event) override;
    void submit(const AudioData& audio) override;
    void stop() override;
    bool is_ready() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace stt
} // namespace parley
