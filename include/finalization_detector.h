#pragma once

/**
 * @file finalization_detector.h
 * @brief Decides when the speaker has finished an utterance
 *
 * Two independent signals:
 * - Quiet timer: no committed fragment for quiet_window_ms after the last one
 * - Repeated partial: the last pattern_window non-blank partials are identical
 *
 * Neither fires while a dispatch is in flight.
 */

#include "common.h"
#include "config.h"
#include <deque>
#include <optional>
#include <string>

namespace live_scribe {

struct FinalizeTrigger {
    enum class Kind {
        TimerExpired,
        RepeatedPartialPattern
    };

    Kind kind = Kind::TimerExpired;
    std::string text;  ///< Repeated partial text; empty for TimerExpired

    static FinalizeTrigger timer_expired() { return FinalizeTrigger{Kind::TimerExpired, ""}; }
    static FinalizeTrigger repeated_partial(const std::string& text) {
        return FinalizeTrigger{Kind::RepeatedPartialPattern, text};
    }
};

const char* finalize_trigger_name(FinalizeTrigger::Kind kind);

/**
 * @brief Quiet timer plus repeated-partial pattern detector
 *
 * Time is passed in explicitly; the owner polls the timer from its loop.
 * Not thread-safe (event loop only).
 */
class FinalizationDetector {
public:
    explicit FinalizationDetector(const FinalizeConfig& config = FinalizeConfig());

    /// Start (or restart) the quiet window from now
    void arm_quiet_timer(TimePoint now);

    void disarm_quiet_timer();

    bool quiet_timer_armed() const { return deadline_.has_value(); }

    /// When the quiet timer will expire, if armed
    std::optional<TimePoint> quiet_deadline() const { return deadline_; }

    /**
     * @brief Check the quiet timer
     *
     * Fires TimerExpired at most once per arming. If the window elapses
     * while dispatching, the timer is consumed without firing.
     */
    std::optional<FinalizeTrigger> poll(TimePoint now, bool dispatching);

    /**
     * @brief Feed one partial transcript
     * @return RepeatedPartialPattern when the window fills with identical text
     *         that is not the currently locked text
     */
    std::optional<FinalizeTrigger> on_partial(const std::string& text, bool dispatching);

    /// A committed transcript arrived: clear the partial window and the lock
    void on_committed();

    /// Clear timer, window and lock
    void reset();

    const std::string& pattern_lock() const { return lock_text_; }
    size_t window_size() const { return window_.size(); }

private:
    FinalizeConfig config_;
    std::optional<TimePoint> deadline_;
    std::deque<std::string> window_;
    std::string lock_text_;
};

} // namespace live_scribe
