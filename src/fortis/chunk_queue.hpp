#pragma once

#include "audio_chunk.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

// Bounded FIFO between the capture framing thread and the network thread.
// push() never waits: when full, the oldest chunk is dropped and counted.
// Only chunks of the currently accepted capture session get in, so two
// sessions can never interleave.
class ChunkQueue {
public:
    explicit ChunkQueue(size_t capacity);

    ChunkQueue(const ChunkQueue&) = delete;
    ChunkQueue& operator=(const ChunkQueue&) = delete;

    // Returns false if the queue is closed or the chunk belongs to another
    // capture session.
    bool push(AudioChunk chunk);

    // Waits up to `timeout` for a chunk. Empty result on timeout or close.
    std::optional<AudioChunk> pop(std::chrono::milliseconds timeout);

    // Discards everything and accepts only `capture_session` from now on.
    // Reopens a closed queue.
    size_t reset(uint64_t capture_session);

    // Discards everything, keeps the accepted session.
    size_t clear();

    // Stop accepting chunks and wake the consumer.
    void close();

    bool closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
    uint64_t accepted_session() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AudioChunk> chunks_;
    uint64_t accepted_session_ = 0;
    bool closed_ = false;
    std::atomic<uint64_t> dropped_{0};
};
