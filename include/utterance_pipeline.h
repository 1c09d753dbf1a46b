#pragma once

#include "common.h"
#include "config.h"
#include "finalization_detector.h"
#include "session_client.h"
#include "utterance_accumulator.h"
#include <string>

namespace live_scribe {

/**
 * @brief Receives pipeline output for display (event loop thread)
 */
class PipelineObserver {
public:
    virtual ~PipelineObserver() = default;

    /// Partial (committed == false) or committed transcript text
    virtual void on_transcript(const std::string& /*text*/, bool /*committed*/) {}

    virtual void on_status(SessionState /*state*/, const std::string& /*error*/) {}

    /// A finalized utterance was handed to the dialogue sink
    virtual void on_utterance(const std::string& /*utterance*/) {}

    virtual void on_dispatch_error(const std::string& /*message*/) {}
};

/**
 * @brief Connects the session client to the detector and accumulator
 *
 * Transcript events flow up from the session into the detector and the
 * accumulator; start/stop flow down. tick() must be called from the event
 * loop regularly to forward audio and check the quiet timer.
 */
class UtterancePipeline : public SessionListener, public DispatchObserver {
public:
    UtterancePipeline(TranscriptionSession& session,
                      DialogueSink& sink,
                      const FinalizeConfig& config = FinalizeConfig(),
                      NowFn now = Clock::now);
    ~UtterancePipeline() override;

    UtterancePipeline(const UtterancePipeline&) = delete;
    UtterancePipeline& operator=(const UtterancePipeline&) = delete;

    void set_observer(PipelineObserver* observer) { observer_ = observer; }

    /// Begin a new active period; InvalidState while one is active
    Result<void> start();

    /// Tear down in order: timer, socket, audio graph, microphone
    void stop();

    /// Forward pending audio and fire the quiet timer if it elapsed
    void tick();

    SessionState state() const { return session_.state(); }

    /// Most specific current error: session error, else last dispatch error
    std::string error_message() const;

    const FinalizationDetector& detector() const { return detector_; }
    const UtteranceAccumulator& accumulator() const { return accumulator_; }

    // SessionListener
    void on_transcript_event(const TranscriptEvent& event) override;
    void on_status_changed(SessionState state, const std::string& error) override;

    // DispatchObserver
    void on_utterance_dispatched(const std::string& utterance) override;
    void on_dispatch_completed(const std::string& utterance) override;
    void on_dispatch_failed(const std::string& utterance, const Error& error) override;

private:
    void handle_trigger(const FinalizeTrigger& trigger, TimePoint now);

    TranscriptionSession& session_;
    FinalizationDetector detector_;
    UtteranceAccumulator accumulator_;
    NowFn now_;
    PipelineObserver* observer_ = nullptr;
    std::string dispatch_error_;
};

} // namespace live_scribe
