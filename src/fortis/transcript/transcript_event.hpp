#pragma once

#include <cstdint>
#include <string>

enum class EventKind { Partial, Final };

// Offsets are character positions [start, end) in the logical transcript,
// which joins committed segments with a single space.
struct TranscriptEvent {
    EventKind kind = EventKind::Partial;
    std::string text;
    uint64_t start = 0;
    uint64_t end = 0;
    uint64_t capture_session = 0;
    uint64_t first_seq = 0;
    uint64_t last_seq = 0;
};

struct Segment {
    std::string text;
    uint64_t start = 0;
    uint64_t end = 0;
    uint64_t capture_session = 0;
    // Chunks of the capture session the text was recognized from.
    uint64_t first_seq = 0;
    uint64_t last_seq = 0;
};
