#include "chunk_queue.hpp"

ChunkQueue::ChunkQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool ChunkQueue::push(AudioChunk chunk) {
    {
        std::lock_guard lock(mutex_);
        if (closed_ || chunk.capture_session != accepted_session_) return false;

        if (chunks_.size() >= capacity_) {
            chunks_.pop_front();
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
        chunks_.push_back(std::move(chunk));
    }
    cv_.notify_one();
    return true;
}

std::optional<AudioChunk> ChunkQueue::pop(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !chunks_.empty(); })) {
        return std::nullopt;
    }
    if (chunks_.empty()) return std::nullopt;

    AudioChunk chunk = std::move(chunks_.front());
    chunks_.pop_front();
    return chunk;
}

size_t ChunkQueue::reset(uint64_t capture_session) {
    std::lock_guard lock(mutex_);
    size_t discarded = chunks_.size();
    chunks_.clear();
    accepted_session_ = capture_session;
    closed_ = false;
    return discarded;
}

size_t ChunkQueue::clear() {
    std::lock_guard lock(mutex_);
    size_t discarded = chunks_.size();
    chunks_.clear();
    return discarded;
}

void ChunkQueue::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ChunkQueue::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

size_t ChunkQueue::size() const {
    std::lock_guard lock(mutex_);
    return chunks_.size();
}

uint64_t ChunkQueue::accepted_session() const {
    std::lock_guard lock(mutex_);
    return accepted_session_;
}
