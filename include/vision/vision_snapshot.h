#pragma once

/**
 * @file vision_snapshot.h
 * @brief Latest participant camera frame, published by whole-value swap
 */

#include "core/frame.h"
#include "core/types.h"
#include <atomic>
#include <memory>

namespace parley {

/**
 * @brief One captured still image
 */
struct VisionSnapshot {
    ByteBuffer image;
    PixelFormat format = PixelFormat::RGB24;
    int width = 0;
    int height = 0;
    TimePoint captured_at;

    double age_seconds(TimePoint now) const {
        return std::chrono::duration_cast<Seconds>(now - captured_at).count();
    }
};

/**
 * @brief Single-writer/single-reader holder for the latest snapshot
 *
 * Writers replace the whole snapshot; readers get an immutable shared
 * pointer, so no lock is needed and a reader never sees a partial update.
 */
class SnapshotStore {
public:
    SnapshotStore() = default;

    // Non-copyable
    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    void publish(VisionSnapshot snapshot) {
        auto next = std::make_shared<const VisionSnapshot>(std::move(snapshot));
        std::atomic_store(&latest_, std::move(next));
    }

    std::shared_ptr<const VisionSnapshot> latest() const {
        return std::atomic_load(&latest_);
    }

    void clear() {
        std::atomic_store(&latest_, std::shared_ptr<const VisionSnapshot>());
    }

private:
    std::shared_ptr<const VisionSnapshot> latest_;
};

/**
 * @brief Drops frames arriving faster than 1/fps since the last accepted one
 */
class FrameThrottle {
public:
    explicit FrameThrottle(int fps);

    /// True if a frame arriving at now should be accepted
    bool accept(TimePoint now);

    void reset() { has_last_ = false; }
    int fps() const { return fps_; }

private:
    int fps_;
    Clock::duration interval_;
    TimePoint last_accepted_;
    bool has_last_ = false;
};

/**
 * @brief Throttled writer side of the vision side-channel
 */
class VisionCapture {
public:
    VisionCapture(SnapshotStore& store, int fps);

    /**
     * @brief Offer an incoming camera frame
     * @return True if it replaced the stored snapshot
     */
    bool offer(const ImageData& image, TimePoint now = Clock::now());

    uint64_t accepted() const { return accepted_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    SnapshotStore& store_;
    FrameThrottle throttle_;
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace parley
