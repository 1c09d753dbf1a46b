#pragma once

#include "config.h"
#include "event_loop.h"
#include "utterance_accumulator.h"
#include <memory>
#include <string>

namespace live_scribe {

/**
 * @brief Interpret a dialogue endpoint response
 *
 * Non-2xx maps to DispatchError; the message is the JSON "detail" field
 * when present, else a generic failure text.
 */
Result<void> parse_dialogue_response(long status, const std::string& body);

/// Request body: {"transcript", "voice_id"?, "conversation_id"?}
std::string build_dialogue_request(const std::string& transcript, const DialogueConfig& config);

/**
 * @brief DialogueSink that POSTs each utterance to an HTTP endpoint (libcurl)
 *
 * The request runs on a loop worker; the completion is posted back to the loop.
 */
class HttpDialogueSink : public DialogueSink {
public:
    HttpDialogueSink(EventLoop& loop, const DialogueConfig& config);
    ~HttpDialogueSink() override;

    HttpDialogueSink(const HttpDialogueSink&) = delete;
    HttpDialogueSink& operator=(const HttpDialogueSink&) = delete;

    void dispatch(const std::string& utterance, Completion done) override;

private:
    EventLoop& loop_;
    DialogueConfig config_;
};

/**
 * @brief DialogueSink used when no endpoint is configured: logs the utterance
 */
class LoggingDialogueSink : public DialogueSink {
public:
    void dispatch(const std::string& utterance, Completion done) override;
};

} // namespace live_scribe
