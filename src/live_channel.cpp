#include "live_channel.h"
#include "live_protocol.h"
#include "logger.h"
#include <curl/curl.h>
#include <deque>

namespace helios {

class LiveChannel::Impl {
public:
    Impl(const ApiConfig& api, const std::string& setup_message)
        : api_(api), setup_message_(setup_message), recv_buffer_(constants::channel::RECV_BUFFER_BYTES) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    ~Impl() {
        release();
        curl_global_cleanup();
    }

    Result<void> open() {
        if (curl_) {
            return Error(ErrorType::InvalidState, "channel already open");
        }

        curl_ = curl_easy_init();
        if (!curl_) {
            return make_connect_error("Failed to initialize CURL");
        }

        std::string url = build_url();
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);  // WebSocket upgrade, then frame API
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(api_.connect_timeout_ms));

        LOG_CHANNEL("Connecting to " + api_.endpoint);
        CURLcode res = curl_easy_perform(curl_);
        if (res != CURLE_OK) {
            std::string reason = curl_easy_strerror(res);
            release();
            return make_connect_error("WebSocket handshake failed: " + reason);
        }

        setup_acknowledged_ = false;
        fragment_.clear();
        outbox_.clear();
        outbox_offset_ = 0;
        pending_.clear();

        outbox_.push_back(setup_message_);
        if (!flush()) {
            std::string reason = pending_.empty() ? "setup send failed" : pending_.back().payload;
            pending_.clear();
            release();
            return make_connect_error(reason);
        }

        LOG_CHANNEL("WebSocket connected, setup sent");
        return {};
    }

    bool send(const std::string& text) {
        if (!curl_) return false;
        outbox_.push_back(text);
        return flush();
    }

    std::vector<ChannelEvent> poll() {
        std::vector<ChannelEvent> events;
        events.swap(pending_);
        if (!curl_) return events;

        if (!flush()) {
            for (auto& e : pending_) events.push_back(std::move(e));
            pending_.clear();
            return events;
        }

        for (int i = 0; i < constants::channel::MAX_FRAMES_PER_POLL && curl_; ++i) {
            size_t received = 0;
            const struct curl_ws_frame* meta = nullptr;
            CURLcode res = curl_ws_recv(curl_, recv_buffer_.data(), recv_buffer_.size(), &received, &meta);

            if (res == CURLE_AGAIN) {
                break;
            }
            if (res == CURLE_GOT_NOTHING) {
                LOG_CHANNEL("Connection closed by peer");
                release();
                events.push_back(ChannelEvent::close("connection closed"));
                break;
            }
            if (res != CURLE_OK) {
                std::string reason = std::string("receive failed: ") + curl_easy_strerror(res);
                Logger::error("[Channel] " + reason);
                release();
                events.push_back(ChannelEvent::error(reason));
                break;
            }
            if (!meta) continue;

            if (meta->flags & CURLWS_CLOSE) {
                LOG_CHANNEL("Close frame received");
                release();
                events.push_back(ChannelEvent::close("close frame"));
                break;
            }
            if (meta->flags & (CURLWS_PING | CURLWS_PONG)) {
                continue;
            }

            fragment_.append(recv_buffer_.data(), received);
            if (meta->bytesleft > 0 || (meta->flags & CURLWS_CONT)) {
                continue;
            }

            std::string text;
            text.swap(fragment_);
            deliver(std::move(text), events);
        }

        return events;
    }

    void close() {
        if (!curl_) return;

        size_t sent = 0;
        CURLcode res = curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
        if (res != CURLE_OK) {
            Logger::warn("[Channel] Close frame not sent: " + std::string(curl_easy_strerror(res)));
        }
        release();
        LOG_CHANNEL("Closed");
    }

    bool is_open() const {
        return curl_ != nullptr;
    }

private:
    std::string build_url() const {
        std::string url = api_.endpoint;
        char* escaped = curl_easy_escape(curl_, api_.api_key.c_str(), static_cast<int>(api_.api_key.size()));
        if (escaped) {
            url += (url.find('?') == std::string::npos ? "?key=" : "&key=");
            url += escaped;
            curl_free(escaped);
        }
        return url;
    }

    void deliver(std::string text, std::vector<ChannelEvent>& events) {
        if (!setup_acknowledged_) {
            auto parsed = protocol::parse_server_message(text);
            if (parsed.is_ok() && parsed.value().setup_complete) {
                setup_acknowledged_ = true;
                LOG_CHANNEL("Session setup complete");
                events.push_back(ChannelEvent::open());
                return;
            }
        }
        events.push_back(ChannelEvent::message(text));
    }

    /// Send queued frames until the socket would block; false on a hard error
    bool flush() {
        while (curl_ && !outbox_.empty()) {
            const std::string& frame = outbox_.front();
            size_t sent = 0;
            CURLcode res = curl_ws_send(curl_, frame.data() + outbox_offset_, frame.size() - outbox_offset_,
                                        &sent, 0, CURLWS_TEXT);
            if (res == CURLE_AGAIN) {
                outbox_offset_ += sent;
                return true;
            }
            if (res != CURLE_OK) {
                std::string reason = std::string("send failed: ") + curl_easy_strerror(res);
                Logger::error("[Channel] " + reason);
                release();
                pending_.push_back(ChannelEvent::error(reason));
                return false;
            }
            outbox_offset_ += sent;
            if (outbox_offset_ >= frame.size()) {
                outbox_.pop_front();
                outbox_offset_ = 0;
            }
        }
        return true;
    }

    void release() {
        if (curl_) {
            curl_easy_cleanup(curl_);
            curl_ = nullptr;
        }
        outbox_.clear();
        outbox_offset_ = 0;
        fragment_.clear();
    }

    ApiConfig api_;
    std::string setup_message_;
    CURL* curl_ = nullptr;
    bool setup_acknowledged_ = false;

    std::vector<char> recv_buffer_;
    std::string fragment_;
    std::deque<std::string> outbox_;
    size_t outbox_offset_ = 0;
    std::vector<ChannelEvent> pending_;
};

LiveChannel::LiveChannel(const ApiConfig& api, const std::string& setup_message)
    : pimpl_(std::make_unique<Impl>(api, setup_message)) {}

LiveChannel::~LiveChannel() = default;

Result<void> LiveChannel::open() {
    return pimpl_->open();
}

bool LiveChannel::send(const std::string& text) {
    return pimpl_->send(text);
}

std::vector<ChannelEvent> LiveChannel::poll() {
    return pimpl_->poll();
}

void LiveChannel::close() {
    pimpl_->close();
}

bool LiveChannel::is_open() const {
    return pimpl_->is_open();
}

} // namespace helios
