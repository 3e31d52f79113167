#pragma once

/**
 * @file frame_queue.h
 * @brief Bounded blocking FIFO connecting two pipeline stages
 */

#include "core/frame.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace parley {

/**
 * @brief Bounded multi-producer single-consumer frame queue
 *
 * push() blocks while the queue holds capacity() frames, which is how a
 * slow stage applies backpressure to the stage feeding it. Upstream and
 * control traffic uses push_unbounded() so two stages pushing at each
 * other can never deadlock.
 */
class FrameQueue {
public:
    explicit FrameQueue(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    // Non-copyable
    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    /**
     * @brief Append a frame, waiting for space
     * @return False if the queue was closed before the frame could be added
     */
    bool push(Frame frame) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push_back(std::move(frame));
        not_empty_.notify_one();
        return true;
    }

    /// Append a frame regardless of capacity
    bool push_unbounded(Frame frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        items_.push_back(std::move(frame));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Remove the oldest frame, waiting until one is available
     * @return The frame, or nullopt once the queue is closed
     */
    std::optional<Frame> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (closed_) return std::nullopt;
        return take_front();
    }

    /// Like pop() but gives up after timeout
    std::optional<Frame> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); })) {
            return std::nullopt;
        }
        if (closed_) return std::nullopt;
        return take_front();
    }

    std::optional<Frame> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || items_.empty()) return std::nullopt;
        return take_front();
    }

    /**
     * @brief Drop queued audio and streaming (non-final) text
     * @return Number of frames dropped
     *
     * Control frames, images and final transcripts stay in order.
     */
    size_t purge_media() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t before = items_.size();
        for (auto it = items_.begin(); it != items_.end();) {
            if (it->is_audio() || (it->is_text() && !it->as_text().final)) {
                it = items_.erase(it);
            } else {
                ++it;
            }
        }
        size_t dropped = before - items_.size();
        if (dropped > 0) {
            not_full_.notify_all();
        }
        return dropped;
    }

    /// Wake all waiters; subsequent push/pop calls fail
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        items_.clear();
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    Frame take_front() {
        Frame front = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return front;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<Frame> items_;
    bool closed_ = false;
};

} // namespace parley
