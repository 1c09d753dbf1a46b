#include "dialogue_client.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace live_scribe {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // anonymous namespace

Result<void> parse_dialogue_response(long status, const std::string& body) {
    if (utils::is_success_status(status)) return Result<void>();

    std::string detail;
    try {
        json data = json::parse(body);
        if (data.is_object() && data.contains("detail")) {
            detail = data["detail"].is_string() ? data["detail"].get<std::string>() : data["detail"].dump();
        }
    } catch (const json::exception&) {
        // Non-JSON error body; fall through to the generic message
    }

    if (detail.empty()) detail = "Failed to process transcript (HTTP " + std::to_string(status) + ")";
    return make_dispatch_error(detail);
}

std::string build_dialogue_request(const std::string& transcript, const DialogueConfig& config) {
    json request;
    request["transcript"] = transcript;
    if (!config.voice_id.empty()) request["voice_id"] = config.voice_id;
    if (!config.session_id.empty()) request["conversation_id"] = config.session_id;
    return request.dump();
}

HttpDialogueSink::HttpDialogueSink(EventLoop& loop, const DialogueConfig& config)
    : loop_(loop), config_(config) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpDialogueSink::~HttpDialogueSink() {
    curl_global_cleanup();
}

void HttpDialogueSink::dispatch(const std::string& utterance, Completion done) {
    std::string request_json = build_dialogue_request(utterance, config_);
    std::string endpoint = config_.endpoint;
    long timeout_ms = config_.timeout_ms;
    EventLoop& loop = loop_;

    loop_.spawn([request_json, endpoint, timeout_ms, done, &loop]() {
        Result<void> result;

        CURL* curl = curl_easy_init();
        if (!curl) {
            result = make_dispatch_error("Failed to initialize CURL");
        } else {
            struct curl_slist* headers = nullptr;
            headers = curl_slist_append(headers, "Content-Type: application/json");

            std::string response_buffer;
            curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_json.c_str());
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

            LOG_DISPATCH("POST " + endpoint);
            CURLcode res = curl_easy_perform(curl);
            if (res != CURLE_OK) {
                result = make_dispatch_error(std::string("Failed to process transcript: ") + curl_easy_strerror(res));
            } else {
                long status = 0;
                curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
                result = parse_dialogue_response(status, response_buffer);
                LOG_DISPATCH("Dialogue endpoint returned HTTP " + std::to_string(status));
            }

            curl_slist_free_all(headers);
            curl_easy_cleanup(curl);
        }

        loop.post([done, result]() { done(result); });
    });
}

void LoggingDialogueSink::dispatch(const std::string& utterance, Completion done) {
    Logger::info("[Dispatch] Utterance: \"" + utterance + "\"");
    done(Result<void>());
}

} // namespace live_scribe
