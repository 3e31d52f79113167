#pragma once

#include "pipeline/stage.h"
#include "vision/vision_snapshot.h"

namespace parley {
namespace stages {

/**
 * @brief Stores throttled camera snapshots for the conversation context
 *
 * Image frames never reach the language model path; with forward_images
 * set they continue toward the avatar stage, otherwise they stop here.
 */
class VisionCaptureStage : public pipeline::Stage {
public:
    VisionCaptureStage(SnapshotStore& store, int fps, bool forward_images);

    void process(Frame frame, Direction direction) override;

    const VisionCapture& capture() const { return capture_; }

private:
    VisionCapture capture_;
    bool forward_images_;
};

} // namespace stages
} // namespace parley
