#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <functional>

namespace live_scribe {

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

/// Injectable time source; components default to Clock::now
using NowFn = std::function<TimePoint()>;

inline int64_t ms_between(TimePoint start, TimePoint end) {
    return std::chrono::duration_cast<Duration>(end - start).count();
}

inline int64_t ms_since(TimePoint start) {
    return ms_between(start, Clock::now());
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 16000;
constexpr size_t DEFAULT_FRAME_SAMPLES = 4096;   // ~256ms @ 16kHz
constexpr size_t DEFAULT_MAILBOX_FRAMES = 8;

// Finalization constants
constexpr int QUIET_WINDOW_MS = 3000;
constexpr size_t PARTIAL_PATTERN_WINDOW = 3;
constexpr size_t PATTERN_LOCK_RESET_DELTA = 5;

// Session constants
constexpr int IMMEDIATE_CLOSE_MS = 500;
constexpr int CLOSE_NORMAL = 1000;
constexpr int CLOSE_NO_STATUS = 1005;
constexpr int CLOSE_ABNORMAL = 1006;
constexpr int CLOSE_POLICY_VIOLATION = 1008;

// Logging cadence
constexpr int CHUNK_LOG_INTERVAL = 100;
constexpr int MESSAGE_LOG_INTERVAL = 10;

} // namespace live_scribe
