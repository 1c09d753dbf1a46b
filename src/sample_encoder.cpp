#include "sample_encoder.h"
#include <algorithm>
#include <cmath>

namespace live_scribe {

SampleEncoder::SampleEncoder(size_t frame_samples)
    : frame_samples_(frame_samples > 0 ? frame_samples : DEFAULT_FRAME_SAMPLES) {
    pending_.reserve(frame_samples_);
}

void SampleEncoder::set_frame_callback(FrameCallback callback) {
    callback_ = std::move(callback);
}

size_t SampleEncoder::push(const float* samples, size_t count) {
    if (!samples) return 0;

    size_t emitted = 0;
    for (size_t i = 0; i < count; i++) {
        pending_.push_back(encode_sample(samples[i]));
        if (pending_.size() == frame_samples_) {
            AudioFrame frame;
            frame.swap(pending_);
            pending_.reserve(frame_samples_);
            emitted++;
            if (callback_) callback_(std::move(frame));
        }
    }
    return emitted;
}

void SampleEncoder::reset() {
    pending_.clear();
}

Sample SampleEncoder::encode_sample(float value) {
    if (std::isnan(value)) return 0;

    double s = std::max(-1.0, std::min(1.0, static_cast<double>(value)));
    double scaled = s < 0 ? s * 32768.0 : s * 32767.0;
    return static_cast<Sample>(std::lround(scaled));
}

std::vector<uint8_t> SampleEncoder::to_le_bytes(const AudioFrame& frame) {
    std::vector<uint8_t> bytes;
    bytes.reserve(frame.size() * 2);
    for (Sample s : frame) {
        uint16_t u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<uint8_t>(u & 0xFF));
        bytes.push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
    }
    return bytes;
}

} // namespace live_scribe
