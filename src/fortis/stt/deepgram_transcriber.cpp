#include "stt/deepgram_transcriber.hpp"
#include "stt/deepgram_protocol.hpp"

#include <curl/curl.h>
#include <curl/websockets.h>
#include <poll.h>

static constexpr auto kSendTimeout = std::chrono::milliseconds(2000);

DeepgramTranscriber::DeepgramTranscriber() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

DeepgramTranscriber::~DeepgramTranscriber() {
    close();
    curl_global_cleanup();
}

std::expected<void, Error> DeepgramTranscriber::connect(const Settings& settings,
                                                        const CaptureFormat& format) {
    close();

    curl_ = curl_easy_init();
    if (!curl_) {
        return std::unexpected(Error{ErrorKind::Connect, "curl_easy_init failed"});
    }

    auto url = deepgram::listen_url(settings, format);
    auto auth = "Authorization: Token " + settings.api_key;
    curl_slist* headers = curl_slist_append(nullptr, auth.c_str());

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(settings.connect_timeout_ms));
    // The upgrade response is part of the attempt and shares its bound.
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(settings.connect_timeout_ms));

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, 0L);

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);

    if (res != CURLE_OK || (status != 0 && status != 101)) {
        std::string detail = res != CURLE_OK ? curl_easy_strerror(res)
                                             : "HTTP " + std::to_string(status);
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
        if (status == 401 || status == 403) {
            return std::unexpected(Error{ErrorKind::Auth, "credentials rejected (" + detail + ")"});
        }
        return std::unexpected(Error{ErrorKind::Connect, detail});
    }

    message_.clear();
    return {};
}

bool DeepgramTranscriber::wait_socket(bool for_write, std::chrono::milliseconds timeout) {
    curl_socket_t sock = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK ||
        sock == CURL_SOCKET_BAD) {
        return false;
    }
    pollfd pfd{.fd = sock, .events = static_cast<short>(for_write ? POLLOUT : POLLIN),
               .revents = 0};
    return ::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0;
}

std::expected<void, Error> DeepgramTranscriber::send_frame(const void* data, size_t len,
                                                           unsigned flags) {
    if (!curl_) {
        return std::unexpected(Error{ErrorKind::Disconnected, "not connected"});
    }

    auto* p = static_cast<const char*>(data);
    size_t offset = 0;
    while (true) {
        size_t sent = 0;
        CURLcode res = curl_ws_send(curl_, p + offset, len - offset, &sent, 0, flags);
        offset += sent;
        if (res == CURLE_OK) {
            if (offset >= len) return {};
            continue;
        }
        if (res == CURLE_AGAIN) {
            if (!wait_socket(true, kSendTimeout)) {
                return std::unexpected(Error{ErrorKind::Send, "send timed out"});
            }
            continue;
        }
        if (res == CURLE_SEND_ERROR || res == CURLE_GOT_NOTHING) {
            return std::unexpected(Error{ErrorKind::Disconnected, curl_easy_strerror(res)});
        }
        return std::unexpected(Error{ErrorKind::Send, curl_easy_strerror(res)});
    }
}

std::expected<void, Error> DeepgramTranscriber::send_audio(std::span<const int16_t> samples) {
    if (samples.empty()) return {};
    return send_frame(samples.data(), samples.size_bytes(), CURLWS_BINARY);
}

std::expected<void, Error> DeepgramTranscriber::finalize() {
    return send_frame(deepgram::kFinalize.data(), deepgram::kFinalize.size(), CURLWS_TEXT);
}

std::expected<void, Error> DeepgramTranscriber::keep_alive() {
    return send_frame(deepgram::kKeepAlive.data(), deepgram::kKeepAlive.size(), CURLWS_TEXT);
}

std::expected<std::optional<ProviderResult>, Error>
DeepgramTranscriber::receive(std::chrono::milliseconds timeout) {
    if (!curl_) {
        return std::unexpected(Error{ErrorKind::Disconnected, "not connected"});
    }

    char buf[4096];
    bool waited = false;
    while (true) {
        size_t got = 0;
        curl_ws_frame* meta = nullptr;
        CURLcode res = curl_ws_recv(curl_, buf, sizeof(buf), &got, &meta);

        // A partially received message stays in message_ until the next call.
        if (res == CURLE_AGAIN) {
            if (waited || !wait_socket(false, timeout)) return std::nullopt;
            waited = true;
            continue;
        }
        if (res != CURLE_OK) {
            return std::unexpected(Error{ErrorKind::Disconnected, curl_easy_strerror(res)});
        }
        if (!meta) return std::nullopt;

        if (meta->flags & CURLWS_CLOSE) {
            return std::unexpected(Error{ErrorKind::Disconnected, "stream closed by provider"});
        }
        if (meta->flags & CURLWS_PING) continue;

        message_.append(buf, got);
        if (meta->bytesleft > 0 || (meta->flags & CURLWS_CONT)) continue;

        std::string payload = std::move(message_);
        message_.clear();

        if (auto err = deepgram::parse_error(payload); !err.empty()) {
            return std::unexpected(Error{ErrorKind::Disconnected, err});
        }
        return deepgram::parse_message(payload);
    }
}

void DeepgramTranscriber::close() {
    if (!curl_) return;

    size_t sent = 0;
    curl_ws_send(curl_, deepgram::kCloseStream.data(), deepgram::kCloseStream.size(), &sent, 0,
                 CURLWS_TEXT);
    curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);

    curl_easy_cleanup(curl_);
    curl_ = nullptr;
    message_.clear();
}
