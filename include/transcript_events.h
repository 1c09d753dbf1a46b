#pragma once

#include "common.h"
#include <string>
#include <variant>

namespace live_scribe {

/// The service accepted the session; audio may now be streamed
struct SessionStarted {
    std::string session_id;
};

/// Provisional hypothesis for the utterance in progress
struct PartialTranscript {
    std::string text;
    TimePoint timestamp;
};

/// Final text for a segment; never revised
struct CommittedTranscript {
    std::string text;
    TimePoint timestamp;
};

/// The service acknowledged a set_config message
struct ConfigAck {};

/// Error reported in-band by the service
struct TranscriptError {
    std::string code;
    std::string message;
};

using TranscriptEvent = std::variant<SessionStarted,
                                     PartialTranscript,
                                     CommittedTranscript,
                                     ConfigAck,
                                     TranscriptError>;

inline const char* transcript_event_name(const TranscriptEvent& event) {
    switch (event.index()) {
        case 0: return "session_started";
        case 1: return "partial_transcript";
        case 2: return "committed_transcript";
        case 3: return "config_ack";
        case 4: return "error";
    }
    return "unknown";
}

} // namespace live_scribe
