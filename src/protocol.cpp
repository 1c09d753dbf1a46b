#include "protocol.h"
#include "sample_encoder.h"
#include <curl/curl.h>
#include <mbedtls/base64.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace live_scribe {

namespace {

std::string string_field(const json& data, const char* key) {
    if (data.contains(key) && data[key].is_string()) return data[key].get<std::string>();
    return "";
}

/// "text", falling back to "transcript" when absent or empty
std::string transcript_text(const json& data) {
    std::string text = string_field(data, "text");
    if (text.empty()) text = string_field(data, "transcript");
    return text;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string url_escape(const std::string& value) {
    CURL* curl = curl_easy_init();
    if (!curl) return value;
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    std::string out = escaped ? escaped : value;
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return out;
}

} // anonymous namespace

std::string base64_encode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) return "";

    size_t needed = 0;
    mbedtls_base64_encode(nullptr, 0, &needed, bytes.data(), bytes.size());

    std::string out(needed, '\0');
    size_t written = 0;
    int rc = mbedtls_base64_encode(reinterpret_cast<unsigned char*>(&out[0]), out.size(), &written,
                                   bytes.data(), bytes.size());
    if (rc != 0) return "";
    out.resize(written);
    return out;
}

std::string build_stream_url(const StreamConfig& config, const std::string& token, const std::string& signed_url) {
    if (!signed_url.empty()) return signed_url;

    std::string url = config.realtime_url;
    url += (url.find('?') == std::string::npos) ? "?" : "&";
    url += "token=" + url_escape(token);
    url += "&model_id=" + url_escape(config.model_id);
    url += "&audio_format=" + url_escape(config.audio_format);
    return url;
}

std::string build_audio_chunk_message(const AudioFrame& frame, int sample_rate) {
    json message;
    message["message_type"] = "input_audio_chunk";
    message["audio_base_64"] = base64_encode(SampleEncoder::to_le_bytes(frame));
    message["sample_rate"] = sample_rate;
    return message.dump();
}

std::string build_set_config_message(const StreamConfig& config) {
    json message;
    message["message_type"] = "set_config";
    message["config"]["vad_silence_threshold_secs"] = config.vad_silence_threshold_secs;
    message["config"]["commit_strategy"] = config.commit_strategy;
    return message.dump();
}

Result<ParsedMessage> parse_server_message(const std::string& raw, TimePoint now) {
    json data;
    try {
        data = json::parse(raw);
    } catch (const json::exception& e) {
        return make_parse_error("Invalid JSON message: " + std::string(e.what()));
    }

    if (!data.is_object()) {
        return make_parse_error("Message is not a JSON object");
    }

    std::string type = string_field(data, "message_type");
    if (type.empty()) type = string_field(data, "type");
    if (type.empty()) {
        return make_parse_error("Message has no message_type");
    }

    if (type == "session_started") {
        return ParsedMessage(SessionStarted{string_field(data, "session_id")});
    }
    if (type == "partial_transcript" || type == "partial_transcript_with_timestamps") {
        return ParsedMessage(PartialTranscript{transcript_text(data), now});
    }
    if (type == "committed_transcript" || type == "committed_transcript_with_timestamps") {
        return ParsedMessage(CommittedTranscript{transcript_text(data), now});
    }
    if (type == "config_updated" || type == "config_set") {
        return ParsedMessage(ConfigAck{});
    }
    if (type == "error" || ends_with(type, "Error")) {
        std::string message = string_field(data, "message");
        if (message.empty()) message = string_field(data, "error");
        if (message.empty()) message = "WebSocket error";
        return ParsedMessage(TranscriptError{type, message});
    }

    return ParsedMessage();
}

} // namespace live_scribe
