#pragma once

/**
 * @file stream_channel.h
 * @brief Persistent bidirectional text channel to the transcription service
 */

#include "errors.h"
#include <string>

namespace live_scribe {

/**
 * @brief Receives channel events
 *
 * Implementations of StreamChannel deliver these on the event loop thread,
 * never on an I/O thread.
 */
class ChannelListener {
public:
    virtual ~ChannelListener() = default;

    virtual void on_channel_open() = 0;
    virtual void on_channel_message(const std::string& text) = 0;

    /// Peer closed, or the connection ended without a close frame (1005/1006)
    virtual void on_channel_closed(int code, const std::string& reason) = 0;

    /// Transport failure (connect failure, read/write error)
    virtual void on_channel_error(const std::string& message) = 0;
};

/**
 * @brief Abstract streaming channel (WebSocket in production)
 */
class StreamChannel {
public:
    virtual ~StreamChannel() = default;

    /**
     * @brief Begin connecting; completion is reported to the listener
     * @return InvalidState if already open or connecting
     */
    virtual Result<void> open(const std::string& url, ChannelListener* listener) = 0;

    /// Send one text message; fails if the channel is not open
    virtual Result<void> send_text(const std::string& text) = 0;

    /**
     * @brief Close the channel
     *
     * No listener callback is delivered for a close requested here.
     */
    virtual void close(int code) = 0;

    virtual bool is_open() const = 0;
};

} // namespace live_scribe
