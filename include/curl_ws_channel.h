#pragma once

#include "event_loop.h"
#include "stream_channel.h"
#include <memory>
#include <string>

namespace live_scribe {

/// Close frame payload: 2-byte big-endian code, then the reason; 1005 if absent
int parse_close_payload(const std::string& payload, std::string& reason);

/**
 * @brief Reassembles the pieces curl_ws_recv hands back into whole frames
 *
 * Data fragments and control frames are buffered separately, so a ping
 * arriving between fragments of a text message leaves it intact.
 */
class WsFrameAssembler {
public:
    enum class Kind { Incomplete, Text, Binary, Close, Control };

    struct Frame {
        Kind kind = Kind::Incomplete;
        std::string payload;
        int close_code = 0;          ///< Close frames only
        std::string close_reason;    ///< Close frames only
    };

    /// @param flags CURLWS_* bits of the piece; @param bytes_left remaining bytes of this frame
    Frame feed(int flags, const char* data, size_t size, long long bytes_left);

    size_t buffered() const { return message_.size() + control_.size(); }

private:
    std::string message_;
    std::string control_;
};

/**
 * @brief StreamChannel over WebSocket, using libcurl's WebSocket API
 *
 * Connects and reads on a dedicated thread; every listener callback is
 * posted to the event loop. A close() or destruction invalidates callbacks
 * that are already queued.
 *
 * Thread Safety:
 * - open()/send_text()/close() are called from the event loop thread
 * - The curl handle is shared with the reader thread under a mutex
 */
class CurlWsChannel : public StreamChannel {
public:
    CurlWsChannel(EventLoop& loop, int connect_timeout_ms);
    ~CurlWsChannel() override;

    CurlWsChannel(const CurlWsChannel&) = delete;
    CurlWsChannel& operator=(const CurlWsChannel&) = delete;

    Result<void> open(const std::string& url, ChannelListener* listener) override;
    Result<void> send_text(const std::string& text) override;
    void close(int code) override;
    bool is_open() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace live_scribe
