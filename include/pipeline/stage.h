#pragma once

/**
 * @file stage.h
 * @brief One processing step of the pipeline
 */

#include "core/frame.h"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace parley {
namespace pipeline {

/**
 * @brief Routing back-channel a stage uses to hand frames to its neighbours
 */
class StageLink {
public:
    virtual ~StageLink() = default;

    /// @return False once the pipeline is shutting down
    virtual bool emit(size_t from, Frame frame, Direction direction) = 0;
};

/**
 * @brief Base class for pipeline stages
 *
 * Each stage runs on its own worker thread and receives frames in arrival
 * order through process(). A stage yields zero or more frames with
 * push_frame(), which may block while the next stage's inbox is full.
 *
 * interrupt() and cancel() are called from other threads while process()
 * may be running; implementations must make them thread-safe and must
 * keep forwarding the Interruption frame itself when it arrives.
 */
class Stage {
public:
    explicit Stage(std::string name) : name_(std::move(name)) {}
    virtual ~Stage() = default;

    // Non-copyable
    Stage(const Stage&) = delete;
    Stage& operator=(const Stage&) = delete;

    const std::string& name() const { return name_; }

    /// Called once before any frame flows; may throw ConfigurationError
    virtual void setup() {}

    /// Handle one frame. The default forwards it unchanged.
    virtual void process(Frame frame, Direction direction) {
        push_frame(std::move(frame), direction);
    }

    /// The participant barged in: abort in-flight work for the current turn
    virtual void interrupt() {}

    /// The session is being torn down: unblock process() as soon as possible
    virtual void cancel() {}

    /// Called once after all worker threads have stopped
    virtual void cleanup() {}

protected:
    /// @return False if the pipeline is shutting down
    bool push_frame(Frame frame, Direction direction = Direction::Downstream) {
        if (!link_) return false;
        return link_->emit(index_, std::move(frame), direction);
    }

private:
    friend class PipelineExecutor;

    void bind(StageLink* link, size_t index) {
        link_ = link;
        index_ = index;
    }

    std::string name_;
    StageLink* link_ = nullptr;
    size_t index_ = 0;
};

/**
 * @brief First stage of a pipeline that produces frames on its own
 *
 * The executor polls pull() from a dedicated thread once Start has
 * travelled through every stage. Pulled frames enter this stage's inbox,
 * so they are delivered through process() like any other frame.
 */
class SourceStage : public Stage {
public:
    using Stage::Stage;

    /// Wait up to timeout for the next captured frame
    virtual std::optional<Frame> pull(std::chrono::milliseconds timeout) = 0;

    /// True once the source will never produce another frame
    virtual bool exhausted() const { return false; }
};

} // namespace pipeline
} // namespace parley
