#include "curl_ws_channel.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <poll.h>
#include <atomic>
#include <mutex>
#include <thread>

namespace live_scribe {

namespace {

constexpr int POLL_INTERVAL_MS = 20;
constexpr int SEND_RETRY_LIMIT = 100;
constexpr size_t RECV_BUFFER_BYTES = 16384;

/// State shared with tasks posted to the loop; outlives the channel if needed
struct ListenerSlot {
    std::atomic<uint64_t> generation{0};
    std::atomic<ChannelListener*> listener{nullptr};
};

} // anonymous namespace

int parse_close_payload(const std::string& payload, std::string& reason) {
    if (payload.size() < 2) {
        reason.clear();
        return CLOSE_NO_STATUS;
    }
    unsigned char hi = static_cast<unsigned char>(payload[0]);
    unsigned char lo = static_cast<unsigned char>(payload[1]);
    reason = payload.substr(2);
    return (hi << 8) | lo;
}

WsFrameAssembler::Frame WsFrameAssembler::feed(int flags, const char* data, size_t size, long long bytes_left) {
    bool is_control = (flags & (CURLWS_CLOSE | CURLWS_PING | CURLWS_PONG)) != 0;
    std::string& buffer = is_control ? control_ : message_;
    if (size > 0) buffer.append(data, size);

    Frame out;
    if (bytes_left > 0) return out;

    if (is_control) {
        out.kind = (flags & CURLWS_CLOSE) ? Kind::Close : Kind::Control;
        out.payload.swap(control_);
        if (out.kind == Kind::Close) out.close_code = parse_close_payload(out.payload, out.close_reason);
        return out;
    }

    // Not the final fragment of the message
    if (flags & CURLWS_CONT) return out;

    out.kind = (flags & CURLWS_TEXT) ? Kind::Text : Kind::Binary;
    out.payload.swap(message_);
    return out;
}

class CurlWsChannel::Impl {
public:
    Impl(EventLoop& loop, int connect_timeout_ms)
        : loop_(loop)
        , connect_timeout_ms_(connect_timeout_ms)
        , slot_(std::make_shared<ListenerSlot>()) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        close(CLOSE_NORMAL);
        curl_global_cleanup();
    }

    Result<void> open(const std::string& url, ChannelListener* listener) {
        if (reader_.joinable()) {
            return make_state_error("Channel already open or connecting");
        }

        uint64_t gen = slot_->generation.fetch_add(1) + 1;
        slot_->listener = listener;
        stop_ = false;
        open_ = false;

        Logger::info("[Session] Opening WebSocket: " + utils::preview(url, 100));
        reader_ = std::thread(&Impl::run, this, url, gen);
        return Result<void>();
    }

    Result<void> send_text(const std::string& text) {
        std::lock_guard<std::mutex> lock(curl_mutex_);
        if (!curl_ || !open_) {
            return make_connection_error("Channel is not open");
        }

        for (int attempt = 0; attempt < SEND_RETRY_LIMIT; attempt++) {
            size_t sent = 0;
            CURLcode res = curl_ws_send(curl_, text.data(), text.size(), &sent, 0, CURLWS_TEXT);
            if (res == CURLE_OK) return Result<void>();
            if (res != CURLE_AGAIN || sent != 0) {
                return make_connection_error(std::string("WebSocket send failed: ") + curl_easy_strerror(res));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return make_connection_error("WebSocket send timed out");
    }

    void close(int code) {
        // Invalidate queued callbacks before anything else
        slot_->generation.fetch_add(1);
        slot_->listener = nullptr;
        stop_ = true;

        {
            std::lock_guard<std::mutex> lock(curl_mutex_);
            if (curl_ && open_) {
                unsigned char payload[2] = {
                    static_cast<unsigned char>((code >> 8) & 0xFF),
                    static_cast<unsigned char>(code & 0xFF)
                };
                size_t sent = 0;
                CURLcode res = curl_ws_send(curl_, payload, sizeof(payload), &sent, 0, CURLWS_CLOSE);
                if (res != CURLE_OK) {
                    Logger::debug(std::string("WebSocket close frame not sent: ") + curl_easy_strerror(res));
                }
            }
        }

        if (reader_.joinable()) reader_.join();
        open_ = false;
    }

    bool is_open() const { return open_; }

private:
    void run(std::string url, uint64_t gen) {
        CURL* curl = curl_easy_init();
        if (!curl) {
            post_error(gen, "Failed to initialize CURL");
            return;
        }

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 2L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_ms_));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &Impl::abort_on_stop);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, this);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            curl_easy_cleanup(curl);
            if (!stop_) {
                post_error(gen, std::string("WebSocket connect failed: ") + curl_easy_strerror(res));
            }
            return;
        }

        {
            std::lock_guard<std::mutex> lock(curl_mutex_);
            curl_ = curl;
            open_ = true;
        }
        post(gen, [](ChannelListener* l) { l->on_channel_open(); });

        curl_socket_t sockfd = CURL_SOCKET_BAD;
        curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &sockfd);

        read_loop(gen, sockfd);

        std::lock_guard<std::mutex> lock(curl_mutex_);
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
        open_ = false;
    }

    void read_loop(uint64_t gen, curl_socket_t sockfd) {
        WsFrameAssembler assembler;
        char buffer[RECV_BUFFER_BYTES];

        while (!stop_) {
            size_t received = 0;
            const struct curl_ws_frame* meta = nullptr;
            CURLcode res;
            {
                std::lock_guard<std::mutex> lock(curl_mutex_);
                res = curl_ws_recv(curl_, buffer, sizeof(buffer), &received, &meta);
            }

            if (res == CURLE_AGAIN) {
                wait_readable(sockfd);
                continue;
            }
            if (stop_) return;

            if (res == CURLE_GOT_NOTHING) {
                post(gen, [](ChannelListener* l) { l->on_channel_closed(CLOSE_ABNORMAL, "connection closed"); });
                return;
            }
            if (res != CURLE_OK) {
                std::string msg = std::string("WebSocket receive failed: ") + curl_easy_strerror(res);
                post(gen, [msg](ChannelListener* l) { l->on_channel_error(msg); });
                return;
            }
            if (!meta) continue;

            WsFrameAssembler::Frame frame = assembler.feed(meta->flags, buffer, received, meta->bytesleft);
            switch (frame.kind) {
                case WsFrameAssembler::Kind::Incomplete:
                case WsFrameAssembler::Kind::Control:
                    // libcurl answers pings itself
                    break;
                case WsFrameAssembler::Kind::Close: {
                    int code = frame.close_code;
                    std::string reason = frame.close_reason;
                    post(gen, [code, reason](ChannelListener* l) { l->on_channel_closed(code, reason); });
                    return;
                }
                case WsFrameAssembler::Kind::Text: {
                    std::string text = std::move(frame.payload);
                    post(gen, [text](ChannelListener* l) { l->on_channel_message(text); });
                    break;
                }
                case WsFrameAssembler::Kind::Binary:
                    LOG_DEBUG(std::string("Ignoring binary WebSocket frame (") + std::to_string(frame.payload.size()) + " bytes)");
                    break;
            }
        }
    }

    void wait_readable(curl_socket_t sockfd) {
        if (sockfd == CURL_SOCKET_BAD) {
            std::this_thread::sleep_for(std::chrono::milliseconds(POLL_INTERVAL_MS));
            return;
        }
        struct pollfd pfd;
        pfd.fd = sockfd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        poll(&pfd, 1, POLL_INTERVAL_MS);
    }

    template<typename Fn>
    void post(uint64_t gen, Fn fn) {
        std::shared_ptr<ListenerSlot> slot = slot_;
        loop_.post([slot, gen, fn]() {
            if (slot->generation.load() != gen) return;
            ChannelListener* listener = slot->listener.load();
            if (listener) fn(listener);
        });
    }

    void post_error(uint64_t gen, const std::string& message) {
        post(gen, [message](ChannelListener* l) { l->on_channel_error(message); });
    }

    static int abort_on_stop(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        return static_cast<Impl*>(clientp)->stop_ ? 1 : 0;
    }

    EventLoop& loop_;
    int connect_timeout_ms_;
    std::shared_ptr<ListenerSlot> slot_;

    std::mutex curl_mutex_;
    CURL* curl_ = nullptr;
    std::atomic<bool> open_{false};
    std::atomic<bool> stop_{false};
    std::thread reader_;
};

CurlWsChannel::CurlWsChannel(EventLoop& loop, int connect_timeout_ms)
    : pimpl_(std::make_unique<Impl>(loop, connect_timeout_ms)) {}

CurlWsChannel::~CurlWsChannel() = default;

Result<void> CurlWsChannel::open(const std::string& url, ChannelListener* listener) {
    return pimpl_->open(url, listener);
}

Result<void> CurlWsChannel::send_text(const std::string& text) {
    return pimpl_->send_text(text);
}

void CurlWsChannel::close(int code) {
    pimpl_->close(code);
}

bool CurlWsChannel::is_open() const {
    return pimpl_->is_open();
}

} // namespace live_scribe
