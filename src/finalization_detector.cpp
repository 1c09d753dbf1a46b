#include "finalization_detector.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

namespace live_scribe {

const char* finalize_trigger_name(FinalizeTrigger::Kind kind) {
    switch (kind) {
        case FinalizeTrigger::Kind::TimerExpired:           return "timer_expired";
        case FinalizeTrigger::Kind::RepeatedPartialPattern: return "repeated_partial";
    }
    return "unknown";
}

FinalizationDetector::FinalizationDetector(const FinalizeConfig& config)
    : config_(config) {
    if (config_.pattern_window < 2) config_.pattern_window = PARTIAL_PATTERN_WINDOW;
}

void FinalizationDetector::arm_quiet_timer(TimePoint now) {
    deadline_ = now + Duration(config_.quiet_window_ms);
}

void FinalizationDetector::disarm_quiet_timer() {
    deadline_.reset();
}

std::optional<FinalizeTrigger> FinalizationDetector::poll(TimePoint now, bool dispatching) {
    if (!deadline_ || now < *deadline_) return std::nullopt;

    deadline_.reset();
    if (dispatching) {
        LOG_DEBUG("Quiet window elapsed during dispatch; not firing");
        return std::nullopt;
    }

    LOG_DETECTOR("Quiet window of " + std::to_string(config_.quiet_window_ms) + "ms elapsed");
    return FinalizeTrigger::timer_expired();
}

std::optional<FinalizeTrigger> FinalizationDetector::on_partial(const std::string& text, bool dispatching) {
    if (dispatching || utils::is_blank(text)) return std::nullopt;

    if (!lock_text_.empty() && text != lock_text_ &&
        utils::length_delta(text, lock_text_) > config_.lock_reset_length_delta) {
        LOG_DEBUG("Partial diverged from locked text, releasing pattern lock");
        lock_text_.clear();
    }

    window_.push_back(text);
    while (window_.size() > config_.pattern_window) {
        window_.pop_front();
    }
    if (window_.size() < config_.pattern_window) return std::nullopt;

    bool all_same = std::all_of(window_.begin(), window_.end(),
                                [this](const std::string& t) { return t == window_.front(); });
    if (!all_same) return std::nullopt;

    std::string detected = window_.front();
    if (detected == lock_text_) return std::nullopt;

    LOG_DETECTOR("Repeated partial pattern (" + std::to_string(config_.pattern_window) +
                 " identical): \"" + utils::preview(detected, 80) + "\"");
    lock_text_ = detected;
    window_.clear();
    return FinalizeTrigger::repeated_partial(detected);
}

void FinalizationDetector::on_committed() {
    window_.clear();
    lock_text_.clear();
}

void FinalizationDetector::reset() {
    deadline_.reset();
    window_.clear();
    lock_text_.clear();
}

} // namespace live_scribe
