#include "agent.h"
#include "audio_capture.h"
#include "credential_client.h"
#include "curl_ws_channel.h"
#include "dialogue_client.h"
#include "event_loop.h"
#include "logger.h"
#include "session_client.h"
#include "utils.h"
#include "utterance_pipeline.h"
#include <atomic>
#include <sstream>

namespace live_scribe {

namespace {

constexpr int LOOP_WAIT_MS = 10;
constexpr int STATS_LOG_INTERVAL_MS = 30000;

/// Prints the live transcript and status changes
class ConsoleObserver : public PipelineObserver {
public:
    void on_transcript(const std::string& text, bool committed) override {
        if (committed) {
            Logger::info("> " + text);
        } else {
            Logger::debug("~ " + text);
        }
    }

    void on_status(SessionState state, const std::string& error) override {
        if (state == SessionState::Error) {
            Logger::error(std::string("Status: ") + session_state_name(state) + ": " + error);
        } else {
            Logger::info(std::string("Status: ") + session_state_name(state));
        }
    }

    void on_utterance(const std::string& utterance) override {
        Logger::info("Utterance finalized: \"" + utterance + "\"");
    }

    void on_dispatch_error(const std::string& message) override {
        Logger::error("Dialogue request failed: " + message);
    }
};

} // anonymous namespace

class ScribeAgent::Impl {
public:
    explicit Impl(const Config& config) : config_(config), running_(false), initialized_(false) {}

    ~Impl() {
        if (pipeline_) pipeline_->stop();
    }

    bool initialize() {
        auto probe = PortAudioCapture::probe_microphone(config_.audio.input_device, config_.audio.sample_rate);
        if (!probe) {
            Logger::error("Microphone check failed: " + probe.error().message);
            return false;
        }
        Logger::info("Microphone OK (" + config_.audio.input_device + ")");

        auto credentials = std::make_shared<HttpCredentialClient>(config_.credential);
        auto channel = std::make_unique<CurlWsChannel>(loop_, config_.stream.connect_timeout_ms);
        auto capture = std::make_unique<PortAudioCapture>(config_.audio.input_device,
                                                          config_.audio.sample_rate,
                                                          config_.audio.frame_samples,
                                                          config_.audio.force_callback_source);

        session_ = std::make_unique<TranscriptionSession>(loop_, config_.stream, credentials,
                                                          std::move(channel), std::move(capture),
                                                          config_.audio.mailbox_frames);

        if (config_.dialogue.endpoint.empty()) {
            Logger::info("No dialogue endpoint configured; finalized utterances will be logged");
            sink_ = std::make_unique<LoggingDialogueSink>();
        } else {
            Logger::info("Dialogue endpoint: " + config_.dialogue.endpoint);
            sink_ = std::make_unique<HttpDialogueSink>(loop_, config_.dialogue);
        }

        pipeline_ = std::make_unique<UtterancePipeline>(*session_, *sink_, config_.finalize);
        pipeline_->set_observer(&observer_);

        initialized_ = true;
        return true;
    }

    int run() {
        if (!initialized_ && !initialize()) {
            return 1;
        }

        Logger::info("=== Live Scribe Started ===");

        auto started = pipeline_->start();
        if (!started) {
            Logger::error("Failed to start session: " + started.error().message);
            return 1;
        }

        running_ = true;
        int exit_code = 0;
        TimePoint last_stats = Clock::now();

        while (running_) {
            loop_.wait_for_task(Duration(LOOP_WAIT_MS));
            loop_.run_pending();
            pipeline_->tick();

            if (pipeline_->state() == SessionState::Error) {
                Logger::error("Session ended: " + pipeline_->error_message());
                exit_code = 1;
                break;
            }

            if (ms_since(last_stats) >= STATS_LOG_INTERVAL_MS) {
                log_stats();
                last_stats = Clock::now();
            }
        }

        pipeline_->stop();
        log_stats();
        return exit_code;
    }

    void shutdown() {
        running_ = false;
    }

private:
    void log_stats() {
        SessionStats stats = session_->stats();
        std::ostringstream oss;
        oss << "Stats: sent=" << stats.frames_sent
            << " dropped_not_ready=" << stats.frames_dropped_not_ready
            << " dropped_mailbox=" << stats.frames_dropped_mailbox
            << " messages=" << stats.messages_received
            << " parse_errors=" << stats.parse_errors
            << " utterances=" << pipeline_->accumulator().dispatch_count();
        Logger::info(oss.str());
    }

    Config config_;
    std::atomic<bool> running_;
    bool initialized_;

    // Outlives the components below; their workers post into it
    EventLoop loop_;
    ConsoleObserver observer_;
    std::unique_ptr<TranscriptionSession> session_;
    std::unique_ptr<DialogueSink> sink_;
    std::unique_ptr<UtterancePipeline> pipeline_;
};

ScribeAgent::ScribeAgent(const Config& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

ScribeAgent::~ScribeAgent() = default;

bool ScribeAgent::initialize() {
    return pimpl_->initialize();
}

int ScribeAgent::run() {
    return pimpl_->run();
}

void ScribeAgent::shutdown() {
    pimpl_->shutdown();
}

} // namespace live_scribe
