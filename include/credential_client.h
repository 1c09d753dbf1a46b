#pragma once

#include "config.h"
#include "errors.h"
#include <memory>
#include <string>

namespace live_scribe {

/**
 * @brief Single-use session credential
 *
 * Either a bare token (the stream URL is built around it) or a complete
 * pre-signed wss:// URL. Fetched on every start and never reused.
 */
struct SessionCredential {
    std::string token;
    std::string signed_url;

    bool is_signed_url() const { return !signed_url.empty(); }
};

/**
 * @brief Source of session credentials
 *
 * fetch() blocks; the session client calls it from a background worker.
 */
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    /**
     * @brief Request a fresh credential
     * @return Credential, or CredentialError / RateLimited
     */
    virtual Result<SessionCredential> fetch() = 0;
};

/**
 * @brief Interpret a credential endpoint response
 *
 * 429 maps to RateLimited. Any other non-2xx maps to CredentialError
 * carrying the body (first 200 characters). A 2xx body is read for
 * "token", then "signed_url", then "access_token"; a value starting with
 * "wss://" is treated as a pre-signed URL whichever field carries it.
 */
Result<SessionCredential> parse_credential_response(long status, const std::string& body);

/**
 * @brief CredentialProvider that GETs a token endpoint over HTTP (libcurl)
 */
class HttpCredentialClient : public CredentialProvider {
public:
    explicit HttpCredentialClient(const CredentialConfig& config);
    ~HttpCredentialClient() override;

    HttpCredentialClient(const HttpCredentialClient&) = delete;
    HttpCredentialClient& operator=(const HttpCredentialClient&) = delete;

    Result<SessionCredential> fetch() override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace live_scribe
