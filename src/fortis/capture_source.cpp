#include "capture_source.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>

CaptureSource::CaptureSource(AudioCapture& capture, RingBuffer& ring_buf, ChunkQueue& queue)
    : capture_(capture), ring_buf_(ring_buf), queue_(queue) {}

CaptureSource::~CaptureSource() {
    close();
}

std::expected<void, Error> CaptureSource::open(const DeviceDescriptor& device,
                                               const CaptureFormat& format,
                                               uint64_t capture_session) {
    close();

    if (format.chunk_samples() == 0) {
        return std::unexpected(Error{ErrorKind::DeviceOpen, "chunk duration too short"});
    }
    if (format.chunk_samples() * sizeof(int16_t) > ring_buf_.capacity()) {
        return std::unexpected(Error{ErrorKind::DeviceOpen, "ring buffer smaller than one chunk"});
    }

    ring_buf_.reset();
    if (auto res = capture_.open(device, format); !res) {
        return std::unexpected(res.error());
    }

    device_ = device;
    format_ = format;
    capture_session_ = capture_session;
    next_seq_.store(0, std::memory_order_relaxed);
    open_.store(true, std::memory_order_release);

    framer_ = std::jthread([this](std::stop_token st) { run(st); });
    return {};
}

void CaptureSource::close() {
    if (!open_.exchange(false, std::memory_order_acq_rel)) return;

    if (framer_.joinable()) {
        framer_.request_stop();
        framer_.join();
    }
    capture_.close();
    ring_buf_.reset();
}

void CaptureSource::run(std::stop_token st) {
    std::mutex m;
    std::condition_variable_any cv;
    auto period = std::chrono::milliseconds(std::max<uint32_t>(format_.chunk_ms / 4, 1));

    while (!st.stop_requested()) {
        cut_chunks();
        std::unique_lock lock(m);
        cv.wait_for(lock, st, period, [] { return false; });
    }
}

void CaptureSource::cut_chunks() {
    const size_t n = format_.chunk_samples();
    while (ring_buf_.available_samples() >= n) {
        AudioChunk chunk{
            .capture_session = capture_session_,
            .seq = next_seq_.load(std::memory_order_relaxed),
            .captured_at = std::chrono::steady_clock::now(),
            .sample_rate = format_.sample_rate,
            .samples = std::vector<int16_t>(n),
        };
        if (!ring_buf_.read_samples(chunk.samples)) break;

        next_seq_.fetch_add(1, std::memory_order_relaxed);
        // Rejected means the queue moved on to another session or closed.
        if (!queue_.push(std::move(chunk))) return;
    }
}
