#include "credential_client.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace live_scribe {

namespace {

constexpr size_t ERROR_BODY_MAX_CHARS = 200;
constexpr size_t TOKEN_LOG_CHARS = 50;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
}

bool starts_with_wss(const std::string& value) {
    return value.compare(0, 6, "wss://") == 0;
}

} // anonymous namespace

Result<SessionCredential> parse_credential_response(long status, const std::string& body) {
    if (status == 429) {
        return make_rate_limited_error("Rate limit exceeded. Please wait a moment and try again.");
    }
    if (!utils::is_success_status(status)) {
        std::string detail = body.empty() ? ("HTTP " + std::to_string(status)) : body.substr(0, ERROR_BODY_MAX_CHARS);
        return make_credential_error("Failed to get token: " + detail);
    }

    json data;
    try {
        data = json::parse(body);
    } catch (const json::exception& e) {
        return make_credential_error("Failed to get token: invalid response (" + std::string(e.what()) + ")");
    }

    std::string value;
    if (data.is_object()) {
        for (const char* key : {"token", "signed_url", "access_token"}) {
            if (data.contains(key) && data[key].is_string() && !data[key].get<std::string>().empty()) {
                value = data[key].get<std::string>();
                break;
            }
        }
    }
    if (value.empty()) {
        return make_credential_error("Failed to get token: no token in response");
    }

    SessionCredential credential;
    if (starts_with_wss(value)) {
        credential.signed_url = value;
    } else {
        credential.token = value;
    }
    return credential;
}

class HttpCredentialClient::Impl {
public:
    explicit Impl(const CredentialConfig& config) : config_(config) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        curl_global_cleanup();
    }

    Result<SessionCredential> fetch() {
        LOG_CREDENTIAL("Requesting token from " + utils::preview(config_.endpoint, 100));

        CURL* curl = curl_easy_init();
        if (!curl) {
            return make_credential_error("Failed to get token: could not initialize CURL");
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Accept: application/json");
        if (!config_.user_id.empty()) {
            headers = curl_slist_append(headers, ("X-USER-ID: " + config_.user_id).c_str());
        }

        std::string response_buffer;
        curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        CURLcode res = curl_easy_perform(curl);
        long status = 0;
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            std::string msg = std::string("Failed to get token: ") + curl_easy_strerror(res);
            Logger::error("[Credential] " + msg);
            return make_credential_error(msg);
        }

        auto result = parse_credential_response(status, response_buffer);
        if (!result) {
            Logger::error("[Credential] HTTP " + std::to_string(status) + ": " + result.error().message);
            return result;
        }

        const SessionCredential& credential = result.value();
        if (credential.is_signed_url()) {
            LOG_CREDENTIAL("Received pre-signed URL: " + utils::preview(credential.signed_url, 100));
        } else {
            LOG_CREDENTIAL("Received token: " + utils::preview(credential.token, TOKEN_LOG_CHARS));
        }
        return result;
    }

private:
    CredentialConfig config_;
};

HttpCredentialClient::HttpCredentialClient(const CredentialConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

HttpCredentialClient::~HttpCredentialClient() = default;

Result<SessionCredential> HttpCredentialClient::fetch() {
    return pimpl_->fetch();
}

} // namespace live_scribe
