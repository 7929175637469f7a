#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct DeviceDescriptor {
    std::string id;                      // PipeWire node.name
    std::string name;                    // node.description
    std::vector<uint32_t> sample_rates;  // empty = server converts any rate
    uint32_t channels = 1;
    bool is_default = false;
};

struct CaptureFormat {
    uint32_t sample_rate = 16000;
    uint32_t channels = 1;
    uint32_t chunk_ms = 100;

    size_t chunk_samples() const {
        return static_cast<size_t>(sample_rate) * channels * chunk_ms / 1000;
    }
};

// One fixed-duration slice of S16_LE samples. Never modified after the
// capture source hands it to the chunk queue.
struct AudioChunk {
    uint64_t capture_session = 0;
    uint64_t seq = 0;
    std::chrono::steady_clock::time_point captured_at;
    uint32_t sample_rate = 0;
    std::vector<int16_t> samples;
};
