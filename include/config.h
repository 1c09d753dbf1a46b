#pragma once

#include "common.h"
#include <string>
#include <cstdint>

namespace live_scribe {

struct AudioConfig {
    std::string input_device = "default";
    int sample_rate = DEFAULT_SAMPLE_RATE;
    /// Samples per encoded frame (block boundary of the encoder)
    size_t frame_samples = DEFAULT_FRAME_SAMPLES;
    /// Frames held between the audio thread and the event loop before new ones are dropped
    size_t mailbox_frames = DEFAULT_MAILBOX_FRAMES;
    /// Skip the worker-thread source and go straight to the callback-driven one
    bool force_callback_source = false;
};

struct CredentialConfig {
    std::string endpoint = "http://localhost:3001/api/scribe-token";
    int timeout_ms = 10000;
    std::string user_id;  ///< Sent as X-USER-ID when set
};

struct StreamConfig {
    std::string realtime_url = "wss://api.elevenlabs.io/v1/speech-to-text/realtime";
    std::string model_id = "scribe_v2_realtime";
    std::string audio_format = "pcm_16000";
    bool send_config = true;                   ///< Send set_config once after session_started
    double vad_silence_threshold_secs = 0.5;
    std::string commit_strategy = "vad";
    int immediate_close_ms = IMMEDIATE_CLOSE_MS;  ///< Closes sooner than this after open are connection failures
    int connect_timeout_ms = 10000;
};

struct FinalizeConfig {
    int quiet_window_ms = QUIET_WINDOW_MS;
    size_t pattern_window = PARTIAL_PATTERN_WINDOW;
    size_t lock_reset_length_delta = PATTERN_LOCK_RESET_DELTA;
};

struct DialogueConfig {
    std::string endpoint;      ///< Empty = log finalized utterances only
    int timeout_ms = 30000;
    std::string session_id;    ///< Forwarded as conversation_id
    std::string voice_id;
};

struct Config {
    AudioConfig audio;
    CredentialConfig credential;
    StreamConfig stream;
    FinalizeConfig finalize;
    DialogueConfig dialogue;

    std::string log_level = "info";
    std::string log_file;

    static Config load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;
};

} // namespace live_scribe
