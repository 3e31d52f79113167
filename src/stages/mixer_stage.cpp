#include "stages/mixer_stage.h"
#include "errors.h"
#include "logger.h"

namespace parley {
namespace stages {

MixerStage::MixerStage(BackgroundTrackLoader loader, std::string source, int sample_rate, float gain)
    : Stage("mixer")
    , loader_(std::move(loader))
    , source_(std::move(source))
    , sample_rate_(sample_rate)
    , gain_(gain) {}

void MixerStage::setup() {
    try {
        BackgroundTrack track = loader_.load(source_, sample_rate_);
        LOG_AUDIO("Background track ready: " + std::to_string(track.size()) + " bytes");
        mixer_ = std::make_unique<BackgroundMixer>(std::move(track), gain_);
    } catch (const MediaFormatError& e) {
        LOG_WARN(std::string("Background mixing disabled: ") + e.what());
    }
}

void MixerStage::process(Frame frame, Direction direction) {
    if (mixer_ && direction == Direction::Downstream && frame.is_audio()) {
        mixer_->mix(frame.mutable_audio());
    }
    push_frame(std::move(frame), direction);
}

} // namespace stages
} // namespace parley
