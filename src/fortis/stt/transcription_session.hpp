#pragma once

#include "audio_chunk.hpp"
#include "config.hpp"
#include "error.hpp"
#include "stt/transcriber.hpp"
#include "transcript/transcript_event.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>

// One logical connection to the provider, from open() until the stream
// ends. Turns provider results into offset-tagged TranscriptEvents that
// continue the transcript from `base_offset`. Does not reconnect by itself.
class TranscriptionSession {
public:
    explicit TranscriptionSession(TranscriberFactory factory);
    ~TranscriptionSession();

    TranscriptionSession(const TranscriptionSession&) = delete;
    TranscriptionSession& operator=(const TranscriptionSession&) = delete;

    std::expected<void, Error> open(const Settings& settings, const CaptureFormat& format,
                                    uint64_t base_offset);

    // Send on a dead connection fails with Send; the caller keeps the chunk.
    std::expected<void, Error> send(const AudioChunk& chunk);

    // Empty result when nothing arrived within `timeout`. After the stream
    // ended every call returns Disconnected.
    std::expected<std::optional<TranscriptEvent>, Error>
        poll_event(std::chrono::milliseconds timeout);

    // Sends a keep-alive when no audio went out for the configured interval.
    std::expected<void, Error> maintain();

    void close();

    bool is_connected() const { return connected_; }
    uint64_t cursor() const { return cursor_; }

private:
    std::expected<void, Error> mark_down(Error err);

    TranscriberFactory factory_;
    std::unique_ptr<StreamingTranscriber> transcriber_;
    bool connected_ = false;
    std::optional<Error> ended_;

    std::chrono::seconds keepalive_{3};
    std::chrono::steady_clock::time_point last_sent_;

    uint64_t cursor_ = 0;

    // Chunks of one capture session sent since its last final result.
    struct ChunkSpan {
        uint64_t capture_session = 0;
        uint64_t first_seq = 0;
        uint64_t last_seq = 0;
    };

    bool have_session_ = false;
    ChunkSpan current_;
    // Results are attributed here until the provider answers the finalize
    // sent on a capture session change.
    std::optional<ChunkSpan> flushing_;
};
