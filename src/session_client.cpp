#include "session_client.h"
#include "logger.h"
#include "protocol.h"
#include "utils.h"
#include <sstream>

namespace live_scribe {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle:                return "idle";
        case SessionState::AcquiringCredential: return "getting-token";
        case SessionState::Connecting:          return "connecting";
        case SessionState::Connected:           return "connected";
        case SessionState::Error:               return "error";
    }
    return "unknown";
}

std::string classify_unexpected_close(int code, int64_t since_open_ms, int immediate_close_ms) {
    if (since_open_ms >= 0 && since_open_ms < immediate_close_ms) {
        if (code == CLOSE_NO_STATUS) {
            return "Connection failed immediately. The token may be invalid or the server rejected the connection. Please try again.";
        }
        if (code == CLOSE_POLICY_VIOLATION) {
            return "Token expired or invalid. Please try again.";
        }
        return "Connection closed immediately. Please check your network connection and try again.";
    }

    if (code == CLOSE_POLICY_VIOLATION) return "Token expired. Please try again.";
    if (code == CLOSE_NO_STATUS) return "Connection lost unexpectedly. Please try again.";
    if (code != CLOSE_NORMAL) {
        return "Connection closed unexpectedly (code: " + std::to_string(code) + "). Please try again.";
    }
    return "Connection closed by server. Please try again.";
}

TranscriptionSession::TranscriptionSession(EventLoop& loop,
                                           const StreamConfig& config,
                                           std::shared_ptr<CredentialProvider> credentials,
                                           std::unique_ptr<StreamChannel> channel,
                                           std::unique_ptr<AudioInput> audio,
                                           size_t mailbox_frames,
                                           NowFn now)
    : loop_(loop)
    , config_(config)
    , credentials_(std::move(credentials))
    , channel_(std::move(channel))
    , audio_(std::move(audio))
    , mailbox_(mailbox_frames)
    , now_(now ? std::move(now) : NowFn(Clock::now))
    , alive_(std::make_shared<bool>(true)) {}

TranscriptionSession::~TranscriptionSession() {
    listener_ = nullptr;
    flags_.intentional_stop = true;
    teardown();
}

Result<void> TranscriptionSession::start() {
    if (state_ != SessionState::Idle && state_ != SessionState::Error) {
        std::string msg = std::string("Cannot start: session is ") + session_state_name(state_);
        Logger::warn("[Session] " + msg);
        return make_state_error(msg);
    }
    if (!credentials_ || !channel_ || !audio_) {
        return make_state_error("Session client is missing a collaborator");
    }

    generation_++;
    flags_ = ConnectionFlags();
    last_error_ = Error();
    mailbox_.clear();
    set_state(SessionState::AcquiringCredential);

    uint64_t gen = generation_;
    std::weak_ptr<bool> alive = alive_;
    std::shared_ptr<CredentialProvider> provider = credentials_;
    EventLoop& loop = loop_;
    loop_.spawn([this, gen, alive, provider, &loop]() {
        Result<SessionCredential> result = provider->fetch();
        loop.post([this, gen, alive, result]() {
            if (alive.expired()) return;
            on_credential(gen, result);
        });
    });

    return Result<void>();
}

void TranscriptionSession::stop() {
    if (state_ == SessionState::Idle) return;

    LOG_SESSION(std::string("Stopping session (state: ") + session_state_name(state_) + ")");
    flags_.intentional_stop = true;
    generation_++;
    teardown();
    last_error_ = Error();
    set_state(SessionState::Idle);
}

void TranscriptionSession::pump_audio() {
    std::string capture_failure = mailbox_.take_failure();
    if (!capture_failure.empty()) {
        if (state_ == SessionState::Connected) {
            fail(make_resource_error(capture_failure));
        }
        return;
    }

    std::vector<AudioFrame> frames = mailbox_.drain();
    stats_.frames_dropped_mailbox = mailbox_.dropped();

    for (const auto& frame : frames) {
        bool can_send = state_ == SessionState::Connected && flags_.session_ready && channel_->is_open();
        if (!can_send) {
            if (stats_.frames_dropped_not_ready == 0) {
                LOG_AUDIO("Audio received but session not ready yet");
            }
            stats_.frames_dropped_not_ready++;
            continue;
        }

        auto sent = channel_->send_text(build_audio_chunk_message(frame, DEFAULT_SAMPLE_RATE));
        if (!sent) {
            Logger::warn("[Session] " + sent.error().message);
            continue;
        }

        stats_.frames_sent++;
        if (stats_.frames_sent % CHUNK_LOG_INTERVAL == 0) {
            LOG_SESSION("Sent " + std::to_string(stats_.frames_sent) + " audio chunks");
        }
    }
}

SessionStats TranscriptionSession::stats() const {
    SessionStats s = stats_;
    s.frames_dropped_mailbox = mailbox_.dropped();
    return s;
}

void TranscriptionSession::on_credential(uint64_t generation, const Result<SessionCredential>& result) {
    if (generation != generation_ || state_ != SessionState::AcquiringCredential) {
        LOG_DEBUG("Ignoring stale credential completion");
        return;
    }

    if (!result) {
        fail(result.error());
        return;
    }

    const SessionCredential& credential = result.value();
    std::string url = build_stream_url(config_, credential.token, credential.signed_url);
    LOG_SESSION(std::string(credential.is_signed_url() ? "Using pre-signed URL" : "Built stream URL") +
                ": " + utils::preview(url, 100));

    set_state(SessionState::Connecting);
    auto opened = channel_->open(url, this);
    if (!opened) {
        fail(make_connection_error(opened.error().message));
    }
}

void TranscriptionSession::on_channel_open() {
    if (state_ != SessionState::Connecting) return;

    flags_.opened = true;
    flags_.opened_at = now_();
    flags_.session_ready = false;
    last_error_ = Error();
    LOG_SESSION("WebSocket opened, waiting for session_started");
    set_state(SessionState::Connected);

    auto started = audio_->start(&mailbox_);
    if (!started) {
        fail(started.error());
    }
}

void TranscriptionSession::on_channel_message(const std::string& text) {
    stats_.messages_received++;
    if (stats_.messages_received % MESSAGE_LOG_INTERVAL == 0) {
        LOG_SESSION("Received " + std::to_string(stats_.messages_received) + " messages");
    }

    auto parsed = parse_server_message(text, now_());
    if (!parsed) {
        stats_.parse_errors++;
        Logger::warn("[Session] " + parsed.error().message + " (raw: " + utils::preview(text, 200) + ")");
        return;
    }
    if (!parsed.value()) {
        Logger::debug("[Session] Unknown message type: " + utils::preview(text, 200));
        return;
    }

    const TranscriptEvent& event = *parsed.value();
    LOG_DEBUG(std::string("Inbound ") + transcript_event_name(event));
    if (std::holds_alternative<SessionStarted>(event)) {
        flags_.session_ready = true;
        LOG_SESSION("Session started (id: " + std::get<SessionStarted>(event).session_id + ")");
        send_config_once();
    } else if (std::holds_alternative<ConfigAck>(event)) {
        LOG_SESSION("Configuration acknowledged");
    } else if (std::holds_alternative<TranscriptError>(event)) {
        const auto& err = std::get<TranscriptError>(event);
        Logger::error("[Session] Service error " + err.code + ": " + err.message);
    }

    if (listener_) listener_->on_transcript_event(event);
}

void TranscriptionSession::on_channel_closed(int code, const std::string& reason) {
    int64_t since_open = flags_.opened ? ms_between(flags_.opened_at, now_()) : -1;

    std::ostringstream oss;
    oss << "WebSocket closed (code: " << code << ", reason: \"" << reason << "\", since open: "
        << (since_open >= 0 ? std::to_string(since_open) + "ms" : std::string("unknown")) << ")";

    if (flags_.intentional_stop) {
        LOG_SESSION(oss.str() + " after intentional stop");
        return;
    }

    Logger::error("[Session] " + oss.str());
    fail(make_connection_error(classify_unexpected_close(code, since_open, config_.immediate_close_ms)));
}

void TranscriptionSession::on_channel_error(const std::string& message) {
    if (flags_.intentional_stop) return;

    Logger::error("[Session] WebSocket error: " + message);
    fail(make_connection_error(CONNECTION_ERROR_MESSAGE));
}

void TranscriptionSession::send_config_once() {
    if (!config_.send_config || flags_.config_sent) return;

    auto sent = channel_->send_text(build_set_config_message(config_));
    if (!sent) {
        // Optional message; the session continues with server defaults
        Logger::warn("[Session] Failed to send configuration: " + sent.error().message);
        return;
    }
    flags_.config_sent = true;
    LOG_SESSION("Sent set_config (vad_silence_threshold_secs=" +
                std::to_string(config_.vad_silence_threshold_secs) + ", commit_strategy=" +
                config_.commit_strategy + ")");
}

void TranscriptionSession::fail(const Error& error) {
    Logger::error(std::string("[Session] ") + error_type_name(error.type) + ": " + error.message);
    generation_++;
    flags_.intentional_stop = true;
    teardown();
    last_error_ = error;
    set_state(SessionState::Error);
}

void TranscriptionSession::teardown() {
    // Socket first, then the audio graph and microphone
    if (channel_) channel_->close(CLOSE_NORMAL);
    if (audio_) audio_->stop();
    mailbox_.clear();
    flags_.session_ready = false;
    flags_.config_sent = false;
    flags_.opened = false;
}

void TranscriptionSession::set_state(SessionState state) {
    state_ = state;
    LOG_SESSION(std::string("Status: ") + session_state_name(state) +
                (last_error_ ? " (" + last_error_.message + ")" : std::string()));
    if (listener_) listener_->on_status_changed(state_, last_error_.message);
}

} // namespace live_scribe
