#pragma once

#include "common.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace live_scribe {

/**
 * @brief Converts normalized float samples into fixed-size PCM16 frames
 *
 * Samples are buffered until a block boundary (frame_samples) is reached;
 * each full block is converted and handed to the frame callback. Runs on
 * the audio capture context and has no network or file side effects.
 *
 * Thread Safety:
 * - Not thread-safe. push() and reset() must be called from one thread
 *   (the capture thread), or serialized by the caller.
 */
class SampleEncoder {
public:
    using FrameCallback = std::function<void(AudioFrame&&)>;

    explicit SampleEncoder(size_t frame_samples = DEFAULT_FRAME_SAMPLES);

    /// Receives each completed frame (ownership moves to the callee)
    void set_frame_callback(FrameCallback callback);

    /**
     * @brief Append samples, emitting a frame for every completed block
     * @param samples Normalized samples, nominally in [-1, 1]
     * @param count Number of samples
     * @return Number of frames emitted by this call
     */
    size_t push(const float* samples, size_t count);

    /// Discard a partially filled block
    void reset();

    /// Samples waiting for the next block boundary
    size_t buffered() const { return pending_.size(); }

    size_t frame_samples() const { return frame_samples_; }

    /**
     * @brief Convert one sample: clamp to [-1, 1], scale asymmetrically, round
     *
     * Negative values scale by 32768, non-negative by 32767. NaN encodes as 0.
     */
    static Sample encode_sample(float value);

    /// Serialize a frame to little-endian bytes regardless of host byte order
    static std::vector<uint8_t> to_le_bytes(const AudioFrame& frame);

private:
    size_t frame_samples_;
    AudioFrame pending_;
    FrameCallback callback_;
};

} // namespace live_scribe
