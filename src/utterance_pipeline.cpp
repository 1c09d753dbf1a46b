#include "utterance_pipeline.h"
#include "logger.h"
#include "utils.h"

namespace live_scribe {

UtterancePipeline::UtterancePipeline(TranscriptionSession& session,
                                     DialogueSink& sink,
                                     const FinalizeConfig& config,
                                     NowFn now)
    : session_(session)
    , detector_(config)
    , accumulator_(detector_, sink)
    , now_(now ? std::move(now) : NowFn(Clock::now)) {
    session_.set_listener(this);
    accumulator_.set_observer(this);
}

UtterancePipeline::~UtterancePipeline() {
    session_.set_listener(nullptr);
    accumulator_.set_observer(nullptr);
}

Result<void> UtterancePipeline::start() {
    auto started = session_.start();
    if (!started) return started;

    detector_.reset();
    accumulator_.stop();
    dispatch_error_.clear();
    return Result<void>();
}

void UtterancePipeline::stop() {
    detector_.disarm_quiet_timer();
    session_.stop();
    accumulator_.stop();
    detector_.reset();
}

void UtterancePipeline::tick() {
    session_.pump_audio();

    TimePoint now = now_();
    auto trigger = detector_.poll(now, accumulator_.is_dispatching());
    if (trigger) handle_trigger(*trigger, now);
}

std::string UtterancePipeline::error_message() const {
    const Error& err = session_.last_error();
    if (err) return err.message;
    return dispatch_error_;
}

void UtterancePipeline::on_transcript_event(const TranscriptEvent& event) {
    if (const auto* partial = std::get_if<PartialTranscript>(&event)) {
        if (utils::is_blank(partial->text)) return;
        LOG_DEBUG("Partial transcript: \"" + partial->text + "\"");
        if (observer_) observer_->on_transcript(partial->text, false);

        auto trigger = detector_.on_partial(partial->text, accumulator_.is_dispatching());
        if (trigger) handle_trigger(*trigger, partial->timestamp);
    } else if (const auto* committed = std::get_if<CommittedTranscript>(&event)) {
        LOG_SESSION("Committed transcript: \"" + utils::preview(committed->text, 120) + "\"");
        detector_.on_committed();
        if (utils::is_blank(committed->text)) return;
        if (observer_) observer_->on_transcript(committed->text, true);
        accumulator_.on_committed_fragment(committed->text, committed->timestamp);
    }
}

void UtterancePipeline::on_status_changed(SessionState state, const std::string& error) {
    if (state == SessionState::Error) {
        // The period is over: drop pending text and ignore in-flight completions
        accumulator_.stop();
        detector_.reset();
    } else if (state == SessionState::Idle) {
        detector_.disarm_quiet_timer();
    }
    if (observer_) observer_->on_status(state, error);
}

void UtterancePipeline::on_utterance_dispatched(const std::string& utterance) {
    dispatch_error_.clear();
    if (observer_) observer_->on_utterance(utterance);
}

void UtterancePipeline::on_dispatch_completed(const std::string& /*utterance*/) {
}

void UtterancePipeline::on_dispatch_failed(const std::string& /*utterance*/, const Error& error) {
    dispatch_error_ = error.message;
    if (observer_) observer_->on_dispatch_error(error.message);
}

void UtterancePipeline::handle_trigger(const FinalizeTrigger& trigger, TimePoint now) {
    DispatchOutcome outcome = accumulator_.on_finalize_trigger(trigger, now);
    if (outcome != DispatchOutcome::Dispatched) {
        LOG_DEBUG(std::string("Finalize trigger ") + finalize_trigger_name(trigger.kind) + ": " +
                  dispatch_outcome_name(outcome));
    }
}

} // namespace live_scribe
