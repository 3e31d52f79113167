#include "stages/vision_stage.h"
#include "logger.h"

namespace parley {
namespace stages {

VisionCaptureStage::VisionCaptureStage(SnapshotStore& store, int fps, bool forward_images)
    : Stage("vision")
    , capture_(store, fps)
    , forward_images_(forward_images) {}

void VisionCaptureStage::process(Frame frame, Direction direction) {
    if (frame.is_image() && direction == Direction::Downstream) {
        const ImageData& image = frame.as_image();
        if (capture_.offer(image)) {
            LOG_VISION("Snapshot " + std::to_string(image.width) + "x" +
                       std::to_string(image.height) + " stored");
        }
        if (forward_images_) {
            push_frame(std::move(frame));
        }
        return;
    }
    push_frame(std::move(frame), direction);
}

} // namespace stages
} // namespace parley
