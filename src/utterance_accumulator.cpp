#include "utterance_accumulator.h"
#include "logger.h"
#include "utils.h"

namespace live_scribe {

const char* dispatch_outcome_name(DispatchOutcome outcome) {
    switch (outcome) {
        case DispatchOutcome::Dispatched:               return "dispatched";
        case DispatchOutcome::RejectedInFlight:         return "rejected_in_flight";
        case DispatchOutcome::RejectedBlank:            return "rejected_blank";
        case DispatchOutcome::RejectedAlreadyProcessed: return "rejected_already_processed";
    }
    return "unknown";
}

UtteranceAccumulator::UtteranceAccumulator(FinalizationDetector& detector, DialogueSink& sink)
    : detector_(detector), sink_(sink) {}

bool UtteranceAccumulator::on_committed_fragment(const std::string& text, TimePoint now) {
    if (utils::is_blank(text)) return false;

    std::string fragment = utils::trim_copy(text);
    if (fragment == last_fragment_) {
        LOG_DEBUG("Ignoring repeated committed fragment");
        return false;
    }

    last_fragment_ = fragment;
    pending_ = pending_.empty() ? fragment : pending_ + " " + fragment;
    last_append_ = now;

    if (!in_flight_) {
        detector_.arm_quiet_timer(now);
    }
    LOG_DISPATCH("Pending utterance: \"" + utils::preview(pending_, 80) + "\"");
    return true;
}

DispatchOutcome UtteranceAccumulator::on_finalize_trigger(const FinalizeTrigger& trigger, TimePoint now) {
    const char* source = finalize_trigger_name(trigger.kind);

    if (in_flight_) {
        LOG_DISPATCH(std::string("Trigger ") + source + " ignored: dispatch in flight");
        return DispatchOutcome::RejectedInFlight;
    }

    std::string candidate = utils::trim_copy(pending_);
    if (utils::is_blank(candidate) && trigger.kind == FinalizeTrigger::Kind::RepeatedPartialPattern) {
        candidate = utils::trim_copy(trigger.text);
    }
    if (utils::is_blank(candidate)) {
        LOG_DEBUG(std::string("Trigger ") + source + " ignored: nothing to dispatch");
        return DispatchOutcome::RejectedBlank;
    }

    if (candidate == processed_marker_) {
        LOG_DISPATCH(std::string("Trigger ") + source + " ignored: utterance already processed");
        pending_.clear();
        last_fragment_.clear();
        return DispatchOutcome::RejectedAlreadyProcessed;
    }

    // Commit every state change before handing off
    in_flight_ = true;
    std::string utterance = candidate;
    pending_.clear();
    last_fragment_.clear();
    detector_.disarm_quiet_timer();
    processed_marker_ = utterance;
    dispatch_count_++;

    int64_t since_append = last_append_ == TimePoint{} ? -1 : ms_between(last_append_, now);
    LOG_DISPATCH(std::string("Dispatching (") + source + ", " +
                 (since_append >= 0 ? std::to_string(since_append) + "ms after last fragment" : std::string("no fragments")) +
                 "): \"" + utils::preview(utterance, 120) + "\"");
    if (observer_) observer_->on_utterance_dispatched(utterance);

    uint64_t gen = generation_;
    sink_.dispatch(utterance, [this, gen, utterance](const Result<void>& result) {
        on_dispatch_done(gen, utterance, result);
    });
    return DispatchOutcome::Dispatched;
}

void UtteranceAccumulator::stop() {
    generation_++;
    in_flight_ = false;
    pending_.clear();
    last_fragment_.clear();
    processed_marker_.clear();
    last_append_ = TimePoint{};
}

void UtteranceAccumulator::on_dispatch_done(uint64_t generation, const std::string& utterance,
                                            const Result<void>& result) {
    if (generation != generation_) {
        LOG_DEBUG("Ignoring dispatch completion from a stopped session");
        return;
    }

    in_flight_ = false;

    if (!result) {
        Logger::error("[Dispatch] " + result.error().message);
        if (observer_) observer_->on_dispatch_failed(utterance, result.error());
    } else {
        LOG_DISPATCH("Dispatch complete");
        if (observer_) observer_->on_dispatch_completed(utterance);
    }

    // Fragments committed during the dispatch start the next utterance
    if (!utils::is_blank(pending_)) {
        detector_.arm_quiet_timer(last_append_);
    }
}

} // namespace live_scribe
