#pragma once

#include "stt/transcriber.hpp"

#include <string>

typedef void CURL;

// Deepgram live transcription over a libcurl WebSocket.
class DeepgramTranscriber : public StreamingTranscriber {
public:
    DeepgramTranscriber();
    ~DeepgramTranscriber() override;

    DeepgramTranscriber(const DeepgramTranscriber&) = delete;
    DeepgramTranscriber& operator=(const DeepgramTranscriber&) = delete;

    std::expected<void, Error> connect(const Settings& settings,
                                       const CaptureFormat& format) override;
    std::expected<void, Error> send_audio(std::span<const int16_t> samples) override;
    std::expected<void, Error> finalize() override;
    std::expected<void, Error> keep_alive() override;
    std::expected<std::optional<ProviderResult>, Error>
        receive(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    std::expected<void, Error> send_frame(const void* data, size_t len, unsigned flags);
    bool wait_socket(bool for_write, std::chrono::milliseconds timeout);

    CURL* curl_ = nullptr;
    std::string message_;
};
