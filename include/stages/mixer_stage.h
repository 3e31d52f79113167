#pragma once

#include "audio/background_mixer.h"
#include "audio/track_loader.h"
#include "pipeline/stage.h"
#include <memory>
#include <string>

namespace parley {
namespace stages {

/**
 * @brief Mixes a looping background track under outgoing speech
 *
 * The track is loaded during setup. A track that cannot be loaded, or a
 * frame that cannot be mixed, leaves the speech untouched.
 */
class MixerStage : public pipeline::Stage {
public:
    MixerStage(BackgroundTrackLoader loader, std::string source, int sample_rate, float gain);

    void setup() override;
    void process(Frame frame, Direction direction) override;

    bool active() const { return mixer_ && mixer_->enabled(); }

private:
    BackgroundTrackLoader loader_;
    std::string source_;
    int sample_rate_;
    float gain_;
    std::unique_ptr<BackgroundMixer> mixer_;
};

} // namespace stages
} // namespace parley
