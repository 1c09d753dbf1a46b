#pragma once

/**
 * @file frame_mailbox.h
 * @brief Bounded one-way handoff of encoded frames from the audio thread
 *
 * The producer never blocks: when the mailbox is full the new frame is
 * dropped and counted. The producer can also leave a failure note for the
 * consumer when capture stops on its own.
 */

#include "common.h"
#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace live_scribe {

/**
 * @brief Drop-when-full frame queue
 *
 * Thread-safe for one producer (capture thread) and one consumer (event loop).
 */
class FrameMailbox {
public:
    explicit FrameMailbox(size_t capacity = DEFAULT_MAILBOX_FRAMES)
        : capacity_(capacity > 0 ? capacity : 1) {}

    /**
     * @brief Hand a frame over to the consumer
     * @return False if the mailbox was full and the frame was dropped
     */
    bool offer(AudioFrame&& frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frames_.size() >= capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        frames_.push_back(std::move(frame));
        return true;
    }

    /// Take every queued frame, oldest first
    std::vector<AudioFrame> drain() {
        std::vector<AudioFrame> out;
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(frames_.size());
        while (!frames_.empty()) {
            out.push_back(std::move(frames_.front()));
            frames_.pop_front();
        }
        return out;
    }

    /// Clears queued frames and any pending failure
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.clear();
        failure_.clear();
    }

    /// Producer side: capture has stopped; the first report wins
    void report_failure(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_.empty()) failure_ = message.empty() ? "Audio capture failed" : message;
    }

    /// Consumer side: the reported failure, once ("" if none)
    std::string take_failure() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        out.swap(failure_);
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.size();
    }

    size_t capacity() const { return capacity_; }

    /// Frames rejected because the mailbox was full
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<AudioFrame> frames_;
    std::string failure_;
    std::atomic<uint64_t> dropped_{0};
};

} // namespace live_scribe
