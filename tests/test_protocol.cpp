/**
 * Wire format tests: stream URL, outbound messages, inbound parsing,
 * WebSocket frame reassembly, credential and dialogue responses, config
 * loading, path resolution.
 *
 * Run from build dir: ./test_protocol
 * No network required.
 */

#include "config.h"
#include "credential_client.h"
#include "curl_ws_channel.h"
#include "dialogue_client.h"
#include "path_utils.h"
#include "protocol.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace live_scribe;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static ParsedMessage parse_ok(const std::string& raw) {
    auto r = parse_server_message(raw, Clock::now());
    if (!r) return ParsedMessage();
    return r.value();
}

int main() {
    // --- base64 ---
    ASSERT(base64_encode({}) == "");
    ASSERT(base64_encode({'M'}) == "TQ==");
    ASSERT(base64_encode({'M', 'a'}) == "TWE=");
    ASSERT(base64_encode({'M', 'a', 'n'}) == "TWFu");
    ASSERT(base64_encode({0x00, 0xFF, 0x10, 0x80}) == "AP8QgA==");

    // --- stream URL ---
    StreamConfig stream;
    ASSERT(build_stream_url(stream, "abc") ==
           "wss://api.elevenlabs.io/v1/speech-to-text/realtime?token=abc&model_id=scribe_v2_realtime&audio_format=pcm_16000");
    ASSERT(build_stream_url(stream, "a b+c/=") ==
           "wss://api.elevenlabs.io/v1/speech-to-text/realtime?token=a%20b%2Bc%2F%3D&model_id=scribe_v2_realtime&audio_format=pcm_16000");
    ASSERT(build_stream_url(stream, "", "wss://example.test/stream?sig=xyz") == "wss://example.test/stream?sig=xyz");

    // --- outbound messages ---
    {
        AudioFrame frame = {1, -1};
        json chunk = json::parse(build_audio_chunk_message(frame));
        ASSERT(chunk["message_type"] == "input_audio_chunk");
        ASSERT(chunk["sample_rate"] == 16000);
        ASSERT(chunk["audio_base_64"] == "AQD//w==");   // 01 00 FF FF

        json cfg = json::parse(build_set_config_message(stream));
        ASSERT(cfg["message_type"] == "set_config");
        ASSERT(cfg["config"]["vad_silence_threshold_secs"] == 0.5);
        ASSERT(cfg["config"]["commit_strategy"] == "vad");
    }

    // --- inbound parsing ---
    {
        ParsedMessage m = parse_ok(R"({"message_type":"session_started","session_id":"s-1"})");
        ASSERT(m && std::holds_alternative<SessionStarted>(*m));
        ASSERT(m && std::get<SessionStarted>(*m).session_id == "s-1");

        m = parse_ok(R"({"type":"partial_transcript","text":"hello wor"})");
        ASSERT(m && std::holds_alternative<PartialTranscript>(*m));
        ASSERT(m && std::get<PartialTranscript>(*m).text == "hello wor");

        m = parse_ok(R"({"message_type":"partial_transcript_with_timestamps","transcript":"fallback"})");
        ASSERT(m && std::get<PartialTranscript>(*m).text == "fallback");

        m = parse_ok(R"({"message_type":"partial_transcript","text":"","transcript":"from transcript"})");
        ASSERT(m && std::get<PartialTranscript>(*m).text == "from transcript");

        m = parse_ok(R"({"message_type":"committed_transcript_with_timestamps","text":"Hello there."})");
        ASSERT(m && std::holds_alternative<CommittedTranscript>(*m));
        ASSERT(m && std::get<CommittedTranscript>(*m).text == "Hello there.");

        m = parse_ok(R"({"message_type":"committed_transcript"})");
        ASSERT(m && std::get<CommittedTranscript>(*m).text.empty());

        m = parse_ok(R"({"message_type":"config_updated"})");
        ASSERT(m && std::holds_alternative<ConfigAck>(*m));
        m = parse_ok(R"({"message_type":"config_set"})");
        ASSERT(m && std::holds_alternative<ConfigAck>(*m));

        m = parse_ok(R"({"message_type":"error","message":"quota exceeded"})");
        ASSERT(m && std::holds_alternative<TranscriptError>(*m));
        ASSERT(m && std::get<TranscriptError>(*m).message == "quota exceeded");

        m = parse_ok(R"({"message_type":"AuthError","error":"bad token"})");
        ASSERT(m && std::get<TranscriptError>(*m).code == "AuthError");
        ASSERT(m && std::get<TranscriptError>(*m).message == "bad token");
        ASSERT(m && std::string(transcript_event_name(*m)) == "error");
        ASSERT(std::string(transcript_event_name(TranscriptEvent(ConfigAck{}))) == "config_ack");
        ASSERT(std::string(transcript_event_name(TranscriptEvent(PartialTranscript{}))) == "partial_transcript");

        // Unknown types are dropped, not errors
        auto unknown = parse_server_message(R"({"message_type":"heartbeat"})", Clock::now());
        ASSERT(unknown.is_ok());
        ASSERT(unknown.is_ok() && !unknown.value().has_value());

        auto malformed = parse_server_message("{not json", Clock::now());
        ASSERT(malformed.is_error());
        ASSERT(malformed.is_error() && malformed.error().type == ErrorType::ProtocolParseError);

        auto untyped = parse_server_message(R"({"text":"x"})", Clock::now());
        ASSERT(untyped.is_error() && untyped.error().type == ErrorType::ProtocolParseError);

        auto array = parse_server_message("[1,2]", Clock::now());
        ASSERT(array.is_error());
    }

    // --- credential responses ---
    {
        auto limited = parse_credential_response(429, R"({"detail":"slow down"})");
        ASSERT(limited.is_error());
        ASSERT(limited.is_error() && limited.error().type == ErrorType::RateLimited);
        ASSERT(limited.is_error() && limited.error().message == "Rate limit exceeded. Please wait a moment and try again.");
        ASSERT(limited.is_error() && limited.error().is_credential_error());

        std::string long_body(500, 'x');
        auto server_error = parse_credential_response(502, long_body);
        ASSERT(server_error.is_error() && server_error.error().type == ErrorType::CredentialError);
        ASSERT(server_error.is_error() && server_error.error().message == "Failed to get token: " + std::string(200, 'x'));

        auto token = parse_credential_response(200, R"({"token":"sutkn_123"})");
        ASSERT(token.is_ok() && token.value().token == "sutkn_123");
        ASSERT(token.is_ok() && !token.value().is_signed_url());

        auto signed_url = parse_credential_response(200, R"({"signed_url":"wss://host/path?x=1"})");
        ASSERT(signed_url.is_ok() && signed_url.value().is_signed_url());
        ASSERT(signed_url.is_ok() && signed_url.value().signed_url == "wss://host/path?x=1");

        auto wss_in_token = parse_credential_response(200, R"({"token":"wss://host/presigned"})");
        ASSERT(wss_in_token.is_ok() && wss_in_token.value().signed_url == "wss://host/presigned");

        auto access = parse_credential_response(201, R"({"access_token":"acc"})");
        ASSERT(access.is_ok() && access.value().token == "acc");

        auto precedence = parse_credential_response(200, R"({"access_token":"acc","token":"tok"})");
        ASSERT(precedence.is_ok() && precedence.value().token == "tok");

        auto empty = parse_credential_response(200, "{}");
        ASSERT(empty.is_error() && empty.error().type == ErrorType::CredentialError);

        auto garbage = parse_credential_response(200, "<html>");
        ASSERT(garbage.is_error() && garbage.error().type == ErrorType::CredentialError);
    }

    // --- dialogue request/response ---
    {
        DialogueConfig dialogue;
        dialogue.session_id = "conv-7";
        dialogue.voice_id = "v1";
        json body = json::parse(build_dialogue_request("Hello there", dialogue));
        ASSERT(body["transcript"] == "Hello there");
        ASSERT(body["conversation_id"] == "conv-7");
        ASSERT(body["voice_id"] == "v1");

        DialogueConfig bare;
        json bare_body = json::parse(build_dialogue_request("x", bare));
        ASSERT(!bare_body.contains("voice_id"));
        ASSERT(!bare_body.contains("conversation_id"));

        ASSERT(parse_dialogue_response(200, "{}").is_ok());
        auto failed_detail = parse_dialogue_response(500, R"({"detail":"Campaign not found"})");
        ASSERT(failed_detail.is_error() && failed_detail.error().type == ErrorType::DispatchError);
        ASSERT(failed_detail.is_error() && failed_detail.error().message == "Campaign not found");
        auto failed_plain = parse_dialogue_response(503, "Service Unavailable");
        ASSERT(failed_plain.is_error() && failed_plain.error().message.find("503") != std::string::npos);
    }

    // --- WebSocket frame reassembly ---
    {
        using Kind = WsFrameAssembler::Kind;
        WsFrameAssembler ws;

        // Single piece
        auto f = ws.feed(CURLWS_TEXT, "{\"a\":1}", 7, 0);
        ASSERT(f.kind == Kind::Text && f.payload == "{\"a\":1}");

        // One frame split across recv calls
        f = ws.feed(CURLWS_TEXT, "hel", 3, 2);
        ASSERT(f.kind == Kind::Incomplete);
        f = ws.feed(CURLWS_TEXT, "lo", 2, 0);
        ASSERT(f.kind == Kind::Text && f.payload == "hello");

        // Ping between fragments of one message leaves it intact
        f = ws.feed(CURLWS_TEXT | CURLWS_CONT, "{\"message_type\":", 16, 0);
        ASSERT(f.kind == Kind::Incomplete);
        f = ws.feed(CURLWS_PING, "pp", 2, 0);
        ASSERT(f.kind == Kind::Control && f.payload == "pp");
        f = ws.feed(CURLWS_TEXT, "\"ping\"}", 7, 0);
        ASSERT(f.kind == Kind::Text && f.payload == "{\"message_type\":\"ping\"}");
        ASSERT(ws.buffered() == 0);

        // Close frame split mid-payload while a message is partly buffered
        f = ws.feed(CURLWS_TEXT | CURLWS_CONT, "part", 4, 0);
        const char close_payload[] = {0x03, static_cast<char>(0xF0), 'b', 'y', 'e'};
        f = ws.feed(CURLWS_CLOSE, close_payload, 2, 3);
        ASSERT(f.kind == Kind::Incomplete);
        f = ws.feed(CURLWS_CLOSE, close_payload + 2, 3, 0);
        ASSERT(f.kind == Kind::Close && f.close_code == CLOSE_POLICY_VIOLATION && f.close_reason == "bye");

        f = ws.feed(CURLWS_CLOSE, "", 0, 0);
        ASSERT(f.kind == Kind::Close && f.close_code == CLOSE_NO_STATUS);

        WsFrameAssembler bin;
        f = bin.feed(CURLWS_BINARY, "\x01\x02", 2, 0);
        ASSERT(f.kind == Kind::Binary && f.payload.size() == 2);

        std::string reason;
        ASSERT(parse_close_payload(std::string("\x03\xe8", 2), reason) == CLOSE_NORMAL && reason.empty());
    }

    // --- config ---
    {
        Config missing = Config::load_from_file("/nonexistent/live_scribe_config.json");
        ASSERT(missing.finalize.quiet_window_ms == 3000);
        ASSERT(missing.audio.frame_samples == 4096);
        ASSERT(missing.stream.model_id == "scribe_v2_realtime");

        std::string path = "test_protocol_config.json";
        {
            std::ofstream out(path);
            out << R"({"finalize":{"quiet_window_ms":1500,"pattern_window":1},"stream":{"send_config":false},)"
                << R"("credential":{"user_id":"u-9"},"audio":{"frame_samples":0}})";
        }
        Config loaded = Config::load_from_file(path);
        ASSERT(loaded.finalize.quiet_window_ms == 1500);
        ASSERT(loaded.finalize.pattern_window == PARTIAL_PATTERN_WINDOW);   // below 2 is rejected
        ASSERT(loaded.stream.send_config == false);
        ASSERT(loaded.credential.user_id == "u-9");
        ASSERT(loaded.audio.frame_samples == DEFAULT_FRAME_SAMPLES);
        ASSERT(loaded.stream.commit_strategy == "vad");

        loaded.save_to_file(path);
        Config reloaded = Config::load_from_file(path);
        ASSERT(reloaded.finalize.quiet_window_ms == 1500);
        ASSERT(reloaded.credential.user_id == "u-9");
        std::remove(path.c_str());
    }

    // --- paths ---
    {
        setenv("HOME", "/home/scribe", 1);
        ASSERT(expand_path("~") == "/home/scribe");
        ASSERT(expand_path("~/logs/scribe.log") == "/home/scribe/logs/scribe.log");
        ASSERT(expand_path("~other/x") == "~other/x");
        ASSERT(expand_path("/var/log/x") == "/var/log/x");
        ASSERT(expand_path("").empty());

        ASSERT(resolve_config_path("~/scribe.json") == "/home/scribe/scribe.json");
        ASSERT(resolve_config_path("custom.json") == "custom.json");
        std::string fallback = resolve_config_path();
        ASSERT(fallback.size() >= 18 && fallback.compare(fallback.size() - 18, 18, "config/config.json") == 0);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All protocol tests passed.\n";
    return 0;
}
