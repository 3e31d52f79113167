#include "vision/vision_snapshot.h"
#include "logger.h"
#include <algorithm>

namespace parley {

FrameThrottle::FrameThrottle(int fps)
    : fps_(std::max(fps, 1)) {
    interval_ = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1.0 / static_cast<double>(fps_)));
}

bool FrameThrottle::accept(TimePoint now) {
    if (has_last_ && now - last_accepted_ < interval_) {
        return false;
    }
    last_accepted_ = now;
    has_last_ = true;
    return true;
}

VisionCapture::VisionCapture(SnapshotStore& store, int fps)
    : store_(store), throttle_(fps) {}

bool VisionCapture::offer(const ImageData& image, TimePoint now) {
    if (image.bytes.empty() || image.width <= 0 || image.height <= 0) {
        dropped_++;
        return false;
    }
    size_t expected = static_cast<size_t>(image.width) * static_cast<size_t>(image.height) *
                      static_cast<size_t>(bytes_per_pixel(image.format));
    if (image.bytes.size() < expected) {
        LOG_VISION("Dropping short image frame (" + std::to_string(image.bytes.size()) +
                   " < " + std::to_string(expected) + " bytes)");
        dropped_++;
        return false;
    }
    if (!throttle_.accept(now)) {
        dropped_++;
        return false;
    }

    VisionSnapshot snapshot;
    snapshot.image = image.bytes;
    snapshot.format = image.format;
    snapshot.width = image.width;
    snapshot.height = image.height;
    snapshot.captured_at = now;
    store_.publish(std::move(snapshot));
    accepted_++;
    return true;
}

} // namespace parley
