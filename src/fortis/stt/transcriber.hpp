#pragma once

#include "audio_chunk.hpp"
#include "config.hpp"
#include "error.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>

struct ProviderResult {
    std::string text;
    bool is_final = false;
    bool from_finalize = false;  // the answer to a finalize() request
};

// One bidirectional streaming connection to a speech-to-text provider.
// Audio goes out in order; results come back whenever the provider has
// them, with no per-chunk acknowledgement. Not thread-safe: one thread
// drives both directions.
class StreamingTranscriber {
public:
    virtual ~StreamingTranscriber() = default;

    // Auth on rejected credentials, Connect for everything else.
    virtual std::expected<void, Error> connect(const Settings& settings,
                                               const CaptureFormat& format) = 0;
    virtual std::expected<void, Error> send_audio(std::span<const int16_t> samples) = 0;
    // Ask the provider to emit finals for all audio sent so far.
    virtual std::expected<void, Error> finalize() = 0;
    virtual std::expected<void, Error> keep_alive() = 0;
    // Disconnected once the stream has ended.
    virtual std::expected<std::optional<ProviderResult>, Error>
        receive(std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
};

using TranscriberFactory = std::function<std::unique_ptr<StreamingTranscriber>()>;
