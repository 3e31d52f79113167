#pragma once

/**
 * @file pipeline_executor.h
 * @brief Drives frames through an ordered chain of stages
 *
 * Features:
 * - One worker thread and one bounded inbox per stage (backpressure)
 * - Interruption broadcast to every downstream stage
 * - Stage-boundary error capture with Error control frames
 * - Graceful stop (End), immediate cancel, idle timeout
 */

#include "core/constants.h"
#include "core/frame.h"
#include "pipeline/stage.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parley {
namespace pipeline {

struct ExecutorOptions {
    size_t queue_capacity = constants::pipeline::DEFAULT_QUEUE_CAPACITY;

    /// Cancel the session after this long without text or turn activity (0 = never)
    std::chrono::milliseconds idle_timeout{constants::pipeline::IDLE_TIMEOUT_S * 1000};

    /// How long one SourceStage::pull() may wait
    std::chrono::milliseconds source_poll{constants::pipeline::SOURCE_POLL_MS};
};

struct RunStatus {
    enum class Kind {
        Completed,
        Cancelled,
        Failed
    };

    Kind kind = Kind::Completed;
    std::string message;

    bool ok() const { return kind == Kind::Completed; }
};

const char* run_status_name(RunStatus::Kind kind);

/// Called with every frame leaving the pipeline (downstream past the last stage, upstream past the first)
using FrameObserver = std::function<void(const Frame& frame)>;

/**
 * @brief Pipeline executor
 *
 * Single use: construct with the stage chain, optionally queue frames,
 * then call run() once. stop(), cancel() and queue_frame() are safe to
 * call from any thread, including signal-forwarding threads and stages.
 */
class PipelineExecutor {
public:
    PipelineExecutor(std::vector<std::shared_ptr<Stage>> stages,
                     ExecutorOptions options = ExecutorOptions());
    ~PipelineExecutor();

    // Non-copyable
    PipelineExecutor(const PipelineExecutor&) = delete;
    PipelineExecutor& operator=(const PipelineExecutor&) = delete;

    /**
     * @brief Run the pipeline until End reaches the output, or cancel/failure
     * @param initial First frame pushed into the chain (normally Start)
     *
     * Blocks the calling thread. Stage cleanup() runs before returning.
     */
    RunStatus run(Frame initial = Frame::control(ControlKind::Start));

    /// Inject a frame at the head of the pipeline
    void queue_frame(Frame frame);

    /// Queue an End frame; in-flight work drains before run() returns
    void stop();

    /// Abort every stage and return from run() as soon as workers stop
    void cancel(const std::string& reason = "cancelled");

    void set_frame_observer(FrameObserver observer);

    bool running() const;
    size_t stage_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pipeline
} // namespace parley
