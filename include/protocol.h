#pragma once

/**
 * @file protocol.h
 * @brief Wire format of the realtime transcription stream
 *
 * Outbound: input_audio_chunk and set_config JSON text messages.
 * Inbound: JSON text messages keyed by "message_type" (or "type").
 */

#include "common.h"
#include "config.h"
#include "errors.h"
#include "transcript_events.h"
#include <optional>
#include <string>
#include <vector>

namespace live_scribe {

/// Result of parsing one inbound message; nullopt for types we ignore
using ParsedMessage = std::optional<TranscriptEvent>;

/// Standard base64 (RFC 4648, padded) via mbedTLS
std::string base64_encode(const std::vector<uint8_t>& bytes);

/**
 * @brief Build the URL used to open the stream
 *
 * A pre-signed URL is returned verbatim. Otherwise:
 * <realtime_url>?token=<urlencoded>&model_id=<model>&audio_format=<format>
 */
std::string build_stream_url(const StreamConfig& config,
                             const std::string& token,
                             const std::string& signed_url = "");

/// {"message_type":"input_audio_chunk","audio_base_64":...,"sample_rate":...}
std::string build_audio_chunk_message(const AudioFrame& frame, int sample_rate = DEFAULT_SAMPLE_RATE);

/// {"message_type":"set_config","config":{"vad_silence_threshold_secs":...,"commit_strategy":...}}
std::string build_set_config_message(const StreamConfig& config);

/**
 * @brief Parse one inbound text message
 * @param raw Message text
 * @param now Receipt time stamped on transcript events
 * @return Event, nullopt for unknown types, or ProtocolParseError
 */
Result<ParsedMessage> parse_server_message(const std::string& raw, TimePoint now);

} // namespace live_scribe
