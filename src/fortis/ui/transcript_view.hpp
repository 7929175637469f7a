#pragma once

#include "audio_chunk.hpp"
#include "config.hpp"
#include "session.hpp"
#include "transcript/transcript_log.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

struct ScreenSize {
    size_t rows = 24;
    size_t cols = 80;
};

// A wrapped transcript row: committed words, then words of the partial.
struct TranscriptLine {
    std::string committed;
    std::string partial;
};

// HH:MM:SS; hours keep counting past 99.
std::string format_elapsed(std::chrono::milliseconds elapsed);

std::string_view state_indicator(SessionState state);

// "● RECORDING  00:01:05  USB Mic  dropped 3"
std::string status_line(const SessionStatus& status);

// Greedy word wrap on single spaces. Words wider than `width` are split.
std::vector<std::string> wrap_text(std::string_view text, size_t width);
std::vector<TranscriptLine> layout_transcript(const TranscriptSnapshot& snapshot, size_t width);

// Code points, which is what the terminal advances by for the text we draw.
size_t display_width(std::string_view text);

// Renders whole frames from session status and transcript snapshots.
class TranscriptView {
public:
    explicit TranscriptView(Config::Ui ui);

    void set_devices(std::vector<DeviceDescriptor> devices);
    const std::vector<DeviceDescriptor>& devices() const { return devices_; }

    void scroll_up(size_t lines);
    void scroll_down(size_t lines);
    size_t scroll_offset() const { return scroll_; }

    std::string render(const SessionStatus& status, const TranscriptSnapshot& snapshot,
                       ScreenSize size);

private:
    std::string device_line(const SessionStatus& status, size_t width) const;

    Config::Ui ui_;
    std::vector<DeviceDescriptor> devices_;
    size_t scroll_ = 0;  // rows up from the bottom
    size_t last_line_count_ = 0;
};
