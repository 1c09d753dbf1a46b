#pragma once

#include "common.h"
#include "errors.h"
#include "finalization_detector.h"
#include <functional>
#include <string>

namespace live_scribe {

/**
 * @brief Downstream consumer of finalized utterances (the dialogue service)
 */
class DialogueSink {
public:
    using Completion = std::function<void(const Result<void>&)>;

    virtual ~DialogueSink() = default;

    /**
     * @brief Hand one finalized utterance downstream
     * @param utterance Non-blank utterance text
     * @param done Invoked exactly once, on the event loop thread (possibly
     *             before dispatch() returns)
     */
    virtual void dispatch(const std::string& utterance, Completion done) = 0;
};

/**
 * @brief Notified of dispatch outcomes (event loop thread)
 */
class DispatchObserver {
public:
    virtual ~DispatchObserver() = default;
    virtual void on_utterance_dispatched(const std::string& utterance) = 0;
    virtual void on_dispatch_completed(const std::string& utterance) = 0;
    virtual void on_dispatch_failed(const std::string& utterance, const Error& error) = 0;
};

enum class DispatchOutcome {
    Dispatched,
    RejectedInFlight,          ///< Another dispatch holds the lock
    RejectedBlank,             ///< Nothing to send
    RejectedAlreadyProcessed   ///< Candidate equals the last dispatched utterance
};

const char* dispatch_outcome_name(DispatchOutcome outcome);

/**
 * @brief Accumulates committed fragments and dispatches each utterance at most once
 *
 * All state changes for a dispatch (lock, snapshot, buffer reset, timer
 * stop, processed marker) happen before the sink is invoked. Completions
 * that arrive after stop() are ignored.
 *
 * Not thread-safe (event loop only).
 */
class UtteranceAccumulator {
public:
    UtteranceAccumulator(FinalizationDetector& detector, DialogueSink& sink);

    void set_observer(DispatchObserver* observer) { observer_ = observer; }

    /**
     * @brief Append a committed fragment
     *
     * Blank fragments and repeats of the previous fragment are ignored.
     * The quiet timer is rearmed from now unless a dispatch is in flight.
     * @return True if the fragment was appended
     */
    bool on_committed_fragment(const std::string& text, TimePoint now);

    /**
     * @brief Act on a finalize trigger
     *
     * The candidate is the pending utterance when non-blank, else the text
     * carried by a repeated-partial trigger.
     */
    DispatchOutcome on_finalize_trigger(const FinalizeTrigger& trigger, TimePoint now);

    /// End of the active period: drop pending text, marker and in-flight dispatch
    void stop();

    bool is_dispatching() const { return in_flight_; }
    const std::string& pending() const { return pending_; }
    const std::string& processed_marker() const { return processed_marker_; }
    uint64_t dispatch_count() const { return dispatch_count_; }

private:
    void on_dispatch_done(uint64_t generation, const std::string& utterance, const Result<void>& result);

    FinalizationDetector& detector_;
    DialogueSink& sink_;
    DispatchObserver* observer_ = nullptr;

    std::string pending_;
    std::string last_fragment_;
    std::string processed_marker_;
    bool in_flight_ = false;
    uint64_t generation_ = 0;
    uint64_t dispatch_count_ = 0;
    TimePoint last_append_{};
};

} // namespace live_scribe
