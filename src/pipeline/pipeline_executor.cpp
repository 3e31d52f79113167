#include "pipeline/pipeline_executor.h"
#include "core/frame_queue.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>
#include <unordered_set>

namespace parley {
namespace pipeline {

const char* run_status_name(RunStatus::Kind kind) {
    switch (kind) {
        case RunStatus::Kind::Completed: return "completed";
        case RunStatus::Kind::Cancelled: return "cancelled";
        case RunStatus::Kind::Failed: return "failed";
        default: return "unknown";
    }
}

namespace {

bool is_turn_activity(const Frame& frame) {
    if (frame.is_text()) return true;
    return frame.is_control(ControlKind::TurnReady) ||
           frame.is_control(ControlKind::ResponseStart) ||
           frame.is_control(ControlKind::ResponseEnd);
}

bool is_discardable(const Frame& frame) {
    return frame.is_audio() || (frame.is_text() && !frame.as_text().final);
}

} // anonymous namespace

class PipelineExecutor::Impl : public StageLink {
public:
    Impl(std::vector<std::shared_ptr<Stage>> stages, ExecutorOptions options)
        : stages_(std::move(stages))
        , options_(options)
        , flush_until_(stages_.size())
        , in_flight_(stages_.size())
        , forwarded_(stages_.size()) {
        for (size_t i = 0; i < stages_.size(); ++i) {
            queues_.push_back(std::make_unique<FrameQueue>(options_.queue_capacity));
            flush_until_[i].store(0);
            in_flight_[i].store(0);
            forwarded_[i].store(false);
        }
        note_activity();
    }

    ~Impl() override {
        close_queues();
        join_threads();
    }

    RunStatus run(Frame initial) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (ran_) {
                return RunStatus{RunStatus::Kind::Failed, "executor already ran"};
            }
            ran_ = true;
            if (finished_) {
                return status_;
            }
            running_ = true;
        }

        if (stages_.empty()) {
            finish(RunStatus::Kind::Failed, "pipeline has no stages");
            return take_status();
        }

        std::ostringstream chain;
        for (size_t i = 0; i < stages_.size(); ++i) {
            chain << (i ? " -> " : "") << stages_[i]->name();
        }
        LOG_PIPE("Starting pipeline: " + chain.str());

        // Setup in order; a failure aborts before any stream opens
        size_t ready = 0;
        for (; ready < stages_.size(); ++ready) {
            try {
                stages_[ready]->setup();
            } catch (const std::exception& e) {
                LOG_ERROR("Stage '" + stages_[ready]->name() + "' setup failed: " + e.what());
                finish(RunStatus::Kind::Failed, stages_[ready]->name() + ": " + e.what());
                break;
            }
        }
        if (ready < stages_.size()) {
            cleanup_stages(ready);
            return take_status();
        }

        for (size_t i = 0; i < stages_.size(); ++i) {
            workers_.emplace_back(&Impl::worker_loop, this, i);
        }
        if (auto* source = dynamic_cast<SourceStage*>(stages_.front().get())) {
            source_thread_ = std::thread(&Impl::source_loop, this, source);
        }

        bool initial_is_start = initial.is_control(ControlKind::Start);
        note_activity();
        queues_.front()->push_unbounded(std::move(initial));
        if (!initial_is_start) {
            mark_started();
        }

        wait_until_finished();

        close_queues();
        join_threads();
        cleanup_stages(stages_.size());

        RunStatus status = take_status();
        LOG_PIPE(std::string("Pipeline ") + run_status_name(status.kind) +
                 (status.message.empty() ? "" : ": " + status.message));
        return status;
    }

    void queue_frame(Frame frame) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (finished_) return;
            if (!started_) {
                pending_.push_back(std::move(frame));
                return;
            }
        }
        enqueue_head(std::move(frame));
    }

    void abort(RunStatus::Kind kind, const std::string& reason) {
        if (!finish(kind, reason)) {
            return;
        }
        if (kind == RunStatus::Kind::Failed) {
            LOG_ERROR("Pipeline failed: " + reason);
        } else {
            LOG_PIPE("Cancelling pipeline: " + reason);
        }
        for (auto& stage : stages_) {
            try {
                stage->cancel();
            } catch (const std::exception& e) {
                LOG_WARN("Stage '" + stage->name() + "' cancel failed: " + e.what());
            }
        }
        close_queues();
    }

    void set_frame_observer(FrameObserver observer) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        observer_ = std::move(observer);
    }

    bool running() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return running_ && !finished_;
    }

    size_t stage_count() const { return stages_.size(); }

    const std::vector<std::shared_ptr<Stage>>& stages() const { return stages_; }

    // =========================================================================
    // StageLink
    // =========================================================================

    bool emit(size_t from, Frame frame, Direction direction) override {
        frame.set_direction(direction);
        if (frame.is_control() && from < stages_.size() && in_flight_[from].load() == frame.id()) {
            forwarded_[from].store(true);
        }
        if (is_turn_activity(frame)) {
            note_activity();
        }

        if (direction == Direction::Downstream) {
            if (frame.is_control(ControlKind::Interruption)) {
                broadcast_interruption(from, frame.id());
            }
            size_t to = from + 1;
            if (to >= stages_.size()) {
                return deliver(std::move(frame));
            }
            if (frame.is_control()) {
                return queues_[to]->push_unbounded(std::move(frame));
            }
            return queues_[to]->push(std::move(frame));
        }

        if (from == 0) {
            return deliver(std::move(frame));
        }
        return queues_[from - 1]->push_unbounded(std::move(frame));
    }

private:
    // =========================================================================
    // Threads
    // =========================================================================

    void worker_loop(size_t index) {
        FrameQueue& inbox = *queues_[index];
        while (auto item = inbox.pop()) {
            Frame frame = std::move(*item);
            Direction direction = frame.direction();

            if (direction == Direction::Downstream) {
                // Media from the interrupted turn that slipped in after the purge
                if (flush_until_[index].load() != 0 && is_discardable(frame)) {
                    continue;
                }
                if (frame.is_control(ControlKind::Interruption)) {
                    uint64_t expected = frame.id();
                    flush_until_[index].compare_exchange_strong(expected, 0);
                }
            }

            if (frame.is_control(ControlKind::Cancel)) {
                abort(RunStatus::Kind::Cancelled, "cancel frame from '" + stages_[index]->name() + "'");
                break;
            }

            dispatch(index, std::move(frame), direction);
        }
    }

    void dispatch(size_t index, Frame frame, Direction direction) {
        Stage& stage = *stages_[index];
        bool is_start = frame.is_control(ControlKind::Start);
        std::optional<Frame> control_copy;
        if (frame.is_control()) {
            control_copy = frame;
            in_flight_[index].store(frame.id());
            forwarded_[index].store(false);
        }

        Error error;
        try {
            stage.process(std::move(frame), direction);
            in_flight_[index].store(0);
            return;
        } catch (const PipelineError& e) {
            error = e.to_error();
        } catch (const std::exception& e) {
            error = Error(ErrorType::Unknown, e.what());
        }
        in_flight_[index].store(0);

        bool fatal = handle_stage_error(index, error, is_start);
        // Control frames must keep travelling: later stages wait on
        // Interruption to stop flushing and on ResponseEnd to commit turns
        if (!fatal && control_copy && !forwarded_[index].load()) {
            emit(index, std::move(*control_copy), direction);
        }
    }

    void source_loop(SourceStage* source) {
        {
            std::unique_lock<std::mutex> lock(state_mutex_);
            state_cv_.wait(lock, [this] { return started_ || finished_; });
            if (finished_) return;
        }
        LOG_PIPE("Source '" + source->name() + "' capturing");

        while (!is_finished()) {
            std::optional<Frame> frame;
            try {
                frame = source->pull(options_.source_poll);
            } catch (const PipelineError& e) {
                handle_stage_error(0, e.to_error(), false);
                return;
            } catch (const std::exception& e) {
                handle_stage_error(0, Error(ErrorType::Unknown, e.what()), false);
                return;
            }

            if (frame && !enqueue_head(std::move(*frame))) {
                return;
            }
            if (source->exhausted()) {
                LOG_PIPE("Source '" + source->name() + "' exhausted, draining");
                enqueue_head(Frame::control(ControlKind::End));
                return;
            }
        }
    }

    void wait_until_finished() {
        std::unique_lock<std::mutex> lock(state_mutex_);
        auto tick = std::chrono::milliseconds(100);
        if (options_.idle_timeout.count() > 0) {
            tick = std::min(tick, options_.idle_timeout);
        }

        while (!finished_) {
            state_cv_.wait_for(lock, tick);
            if (finished_) break;

            if (options_.idle_timeout.count() > 0 && idle_for() >= options_.idle_timeout) {
                lock.unlock();
                abort(RunStatus::Kind::Cancelled, "idle timeout");
                lock.lock();
            }
        }
    }

    void join_threads() {
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
        workers_.clear();
        if (source_thread_.joinable()) {
            source_thread_.join();
        }
    }

    void cleanup_stages(size_t count) {
        for (size_t i = 0; i < count; ++i) {
            try {
                stages_[i]->cleanup();
            } catch (const std::exception& e) {
                LOG_WARN("Stage '" + stages_[i]->name() + "' cleanup failed: " + e.what());
            }
        }
        std::lock_guard<std::mutex> lock(state_mutex_);
        running_ = false;
    }

    // =========================================================================
    // Routing
    // =========================================================================

    bool enqueue_head(Frame frame) {
        FrameQueue& head = *queues_.front();
        if (frame.is_control() || frame.direction() == Direction::Upstream) {
            return head.push_unbounded(std::move(frame));
        }
        return head.push(std::move(frame));
    }

    /// Frame left the chain at either end
    bool deliver(Frame frame) {
        FrameObserver observer;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            observer = observer_;
        }
        if (observer) {
            observer(frame);
        }

        if (frame.direction() != Direction::Downstream || !frame.is_control()) {
            return true;
        }

        const ControlData& control = frame.as_control();
        switch (control.kind) {
            case ControlKind::Start:
                mark_started();
                break;
            case ControlKind::End:
                LOG_PIPE("End reached output, pipeline drained");
                finish(RunStatus::Kind::Completed, "");
                break;
            case ControlKind::Cancel:
                abort(RunStatus::Kind::Cancelled, "cancel frame");
                break;
            case ControlKind::Interruption: {
                std::lock_guard<std::mutex> lock(interrupt_mutex_);
                broadcast_ids_.erase(frame.id());
                break;
            }
            case ControlKind::Error:
                if (control.fatal) {
                    abort(RunStatus::Kind::Failed, control.error.message);
                }
                break;
            default:
                break;
        }
        return true;
    }

    void broadcast_interruption(size_t from, uint64_t id) {
        {
            std::lock_guard<std::mutex> lock(interrupt_mutex_);
            if (!broadcast_ids_.insert(id).second) {
                return;
            }
        }

        size_t purged = 0;
        for (size_t j = from + 1; j < stages_.size(); ++j) {
            flush_until_[j].store(id);
            try {
                stages_[j]->interrupt();
            } catch (const std::exception& e) {
                LOG_WARN("Stage '" + stages_[j]->name() + "' interrupt failed: " + e.what());
            }
            purged += queues_[j]->purge_media();
        }
        LOG_PIPE("Interruption from '" + stages_[from]->name() + "', dropped " +
                 std::to_string(purged) + " queued frames");
    }

    /// @return True if the error ended the session
    bool handle_stage_error(size_t index, const Error& error, bool during_start) {
        const std::string& name = stages_[index]->name();
        bool at_edge = index == 0 || index + 1 == stages_.size();
        bool fatal_at_start = during_start &&
            (error.type == ErrorType::Configuration || error.type == ErrorType::Connection);
        bool fatal = at_edge || fatal_at_start;

        LOG_ERROR("Stage '" + name + "' error (" + error_type_name(error.type) + "): " + error.message);
        if (fatal) {
            abort(RunStatus::Kind::Failed, name + ": " + error.message);
            return true;
        }
        emit(index, Frame::error(error, false), Direction::Downstream);
        return false;
    }

    // =========================================================================
    // State
    // =========================================================================

    void mark_started() {
        std::vector<Frame> pending;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (started_) return;
            started_ = true;
            // Drain under the lock so later queue_frame() calls stay behind these
            for (auto& frame : pending_) {
                if (!queues_.front()->push_unbounded(std::move(frame))) break;
            }
            pending_.clear();
        }
        state_cv_.notify_all();
    }

    bool finish(RunStatus::Kind kind, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (finished_) return false;
            finished_ = true;
            status_.kind = kind;
            status_.message = message;
        }
        state_cv_.notify_all();
        return true;
    }

    bool is_finished() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return finished_;
    }

    RunStatus take_status() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return status_;
    }

    void close_queues() {
        for (auto& queue : queues_) {
            queue->close();
        }
    }

    void note_activity() {
        last_activity_.store(Clock::now().time_since_epoch().count());
    }

    std::chrono::milliseconds idle_for() const {
        Clock::duration last(last_activity_.load());
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now().time_since_epoch() - last);
    }

    std::vector<std::shared_ptr<Stage>> stages_;
    ExecutorOptions options_;
    std::vector<std::unique_ptr<FrameQueue>> queues_;

    /// Per stage: id of the Interruption it is waiting for (0 = not flushing)
    std::vector<std::atomic<uint64_t>> flush_until_;

    /// Per stage: id of the control frame being processed, and whether the stage passed it on
    std::vector<std::atomic<uint64_t>> in_flight_;
    std::vector<std::atomic<bool>> forwarded_;

    std::vector<std::thread> workers_;
    std::thread source_thread_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool ran_ = false;
    bool running_ = false;
    bool started_ = false;
    bool finished_ = false;
    RunStatus status_;
    std::vector<Frame> pending_;
    FrameObserver observer_;

    std::mutex interrupt_mutex_;
    std::unordered_set<uint64_t> broadcast_ids_;

    std::atomic<Clock::rep> last_activity_{0};
};

// =============================================================================
// PipelineExecutor Public Interface
// =============================================================================

PipelineExecutor::PipelineExecutor(std::vector<std::shared_ptr<Stage>> stages, ExecutorOptions options)
    : impl_(std::make_unique<Impl>(std::move(stages), options)) {
    const auto& bound = impl_->stages();
    for (size_t i = 0; i < bound.size(); ++i) {
        bound[i]->bind(impl_.get(), i);
    }
}

PipelineExecutor::~PipelineExecutor() = default;

RunStatus PipelineExecutor::run(Frame initial) {
    return impl_->run(std::move(initial));
}

void PipelineExecutor::queue_frame(Frame frame) {
    impl_->queue_frame(std::move(frame));
}

void PipelineExecutor::stop() {
    LOG_PIPE("Stop requested, draining");
    impl_->queue_frame(Frame::control(ControlKind::End));
}

void PipelineExecutor::cancel(const std::string& reason) {
    impl_->abort(RunStatus::Kind::Cancelled, reason);
}

void PipelineExecutor::set_frame_observer(FrameObserver observer) {
    impl_->set_frame_observer(std::move(observer));
}

bool PipelineExecutor::running() const {
    return impl_->running();
}

size_t PipelineExecutor::stage_count() const {
    return impl_->stage_count();
}

} // namespace pipeline
} // namespace parley
