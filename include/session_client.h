#pragma once

#include "audio_capture.h"
#include "common.h"
#include "config.h"
#include "credential_client.h"
#include "errors.h"
#include "event_loop.h"
#include "frame_mailbox.h"
#include "stream_channel.h"
#include "transcript_events.h"
#include <cstdint>
#include <memory>
#include <string>

namespace live_scribe {

/**
 * @brief Lifecycle of one transcription session
 *
 * Idle -> AcquiringCredential -> Connecting -> Connected -> {Idle | Error}
 */
enum class SessionState {
    Idle,
    AcquiringCredential,
    Connecting,
    Connected,
    Error
};

/// Wire name: idle, getting-token, connecting, connected, error
const char* session_state_name(SessionState state);

/**
 * @brief User-facing message for a close the client did not request
 * @param code WebSocket close code (1005 when the frame carried none)
 * @param since_open_ms Time between open and close; negative if unknown
 * @param immediate_close_ms Closes sooner than this count as a failed connect
 */
std::string classify_unexpected_close(int code, int64_t since_open_ms, int immediate_close_ms = IMMEDIATE_CLOSE_MS);

/// Reported for transport error events on the channel
constexpr const char* CONNECTION_ERROR_MESSAGE = "Connection error. Token may have expired. Please try again.";

/**
 * @brief Observer of session output
 *
 * Called on the event loop thread.
 */
class SessionListener {
public:
    virtual ~SessionListener() = default;

    virtual void on_transcript_event(const TranscriptEvent& event) = 0;

    /// Every lifecycle transition; error is empty unless state is Error
    virtual void on_status_changed(SessionState state, const std::string& error) = 0;
};

struct SessionStats {
    uint64_t frames_sent = 0;
    uint64_t frames_dropped_not_ready = 0;  ///< Arrived before session_started
    uint64_t frames_dropped_mailbox = 0;    ///< Mailbox was full on the audio thread
    uint64_t messages_received = 0;
    uint64_t parse_errors = 0;
};

/**
 * @brief Transcription session client
 *
 * Owns one network session per active period: fetches a credential,
 * opens the channel, streams frames once the service reports
 * session_started, and turns inbound messages into TranscriptEvents.
 *
 * Thread Safety:
 * - All methods must be called from the event loop thread
 * - Blocking work (credential fetch) runs on a loop worker and resumes on the loop
 */
class TranscriptionSession : private ChannelListener {
public:
    TranscriptionSession(EventLoop& loop,
                         const StreamConfig& config,
                         std::shared_ptr<CredentialProvider> credentials,
                         std::unique_ptr<StreamChannel> channel,
                         std::unique_ptr<AudioInput> audio,
                         size_t mailbox_frames = DEFAULT_MAILBOX_FRAMES,
                         NowFn now = Clock::now);
    ~TranscriptionSession() override;

    TranscriptionSession(const TranscriptionSession&) = delete;
    TranscriptionSession& operator=(const TranscriptionSession&) = delete;

    void set_listener(SessionListener* listener) { listener_ = listener; }

    /**
     * @brief Begin a session
     * @return InvalidState unless the state is Idle or Error
     */
    Result<void> start();

    /**
     * @brief End the session and release the channel, audio graph and microphone
     *
     * Forces Idle. A no-op (no status emitted) when already Idle.
     */
    void stop();

    /// Forward encoded frames from the audio thread; call once per loop iteration.
    /// A capture failure reported by the audio thread ends the session (ResourceError).
    void pump_audio();

    SessionState state() const { return state_; }

    /// Most recent error; cleared on a successful open and on start()
    const Error& last_error() const { return last_error_; }

    bool is_session_ready() const { return flags_.session_ready; }

    SessionStats stats() const;

    /// Mailbox the audio input delivers into
    FrameMailbox& mailbox() { return mailbox_; }

private:
    /// Per-connection flags; reset on every start and teardown
    struct ConnectionFlags {
        bool session_ready = false;     ///< session_started received; audio may flow
        bool intentional_stop = false;  ///< stop() requested; closes are not errors
        bool config_sent = false;       ///< set_config already sent this session
        bool opened = false;
        TimePoint opened_at{};
    };

    void on_credential(uint64_t generation, const Result<SessionCredential>& result);

    void on_channel_open() override;
    void on_channel_message(const std::string& text) override;
    void on_channel_closed(int code, const std::string& reason) override;
    void on_channel_error(const std::string& message) override;

    void send_config_once();
    void fail(const Error& error);
    void teardown();
    void set_state(SessionState state);

    EventLoop& loop_;
    StreamConfig config_;
    std::shared_ptr<CredentialProvider> credentials_;
    std::unique_ptr<StreamChannel> channel_;
    std::unique_ptr<AudioInput> audio_;
    FrameMailbox mailbox_;
    NowFn now_;

    SessionListener* listener_ = nullptr;
    SessionState state_ = SessionState::Idle;
    Error last_error_;
    ConnectionFlags flags_;
    uint64_t generation_ = 0;
    SessionStats stats_;

    /// Expires with this object; guards tasks still queued on the loop
    std::shared_ptr<bool> alive_;
};

} // namespace live_scribe
