#pragma once

#include "audio_chunk.hpp"
#include "chunk_queue.hpp"
#include "error.hpp"
#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <thread>

// Turns the raw sample stream of an AudioCapture into fixed-size, sequenced
// AudioChunks. The hardware callback only fills the ring buffer; slicing,
// allocation and the queue handoff happen on the framing thread.
class CaptureSource {
public:
    CaptureSource(AudioCapture& capture, RingBuffer& ring_buf, ChunkQueue& queue);
    ~CaptureSource();

    CaptureSource(const CaptureSource&) = delete;
    CaptureSource& operator=(const CaptureSource&) = delete;

    // Starts a new capture session on `device`. Sequence numbers restart at 0.
    std::expected<void, Error> open(const DeviceDescriptor& device, const CaptureFormat& format,
                                    uint64_t capture_session);

    // Idempotent. Samples short of a full chunk are discarded.
    void close();

    bool is_open() const { return open_.load(std::memory_order_acquire); }
    uint64_t capture_session() const { return capture_session_; }
    const DeviceDescriptor& device() const { return device_; }
    uint64_t chunks_produced() const { return next_seq_.load(std::memory_order_relaxed); }

private:
    void run(std::stop_token st);
    void cut_chunks();

    AudioCapture& capture_;
    RingBuffer& ring_buf_;
    ChunkQueue& queue_;

    DeviceDescriptor device_;
    CaptureFormat format_;
    uint64_t capture_session_ = 0;
    std::atomic<uint64_t> next_seq_{0};
    std::atomic<bool> open_{false};

    std::jthread framer_;
};
