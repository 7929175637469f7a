#include "ui/transcript_view.hpp"

#include <algorithm>
#include <format>

namespace {

constexpr std::string_view kReset = "\x1b[0m";
constexpr std::string_view kBold = "\x1b[1m";
constexpr std::string_view kDim = "\x1b[2m";
constexpr std::string_view kRed = "\x1b[31m";
constexpr std::string_view kClearLine = "\x1b[2K";

constexpr std::string_view kHelp =
    "r start  space pause/resume  d device  s settings  x reset  j/k scroll  q quit";

struct Word {
    std::string text;
    bool partial = false;
};

std::string_view theme_color(std::string_view theme) {
    if (theme == "mono") return "";
    if (theme == "green") return "\x1b[32m";
    if (theme == "yellow") return "\x1b[33m";
    if (theme == "magenta") return "\x1b[35m";
    if (theme == "cyan") return "\x1b[36m";
    return "\x1b[34m";
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte length of the first `n` code points of `text`.
size_t prefix_bytes(std::string_view text, size_t n) {
    size_t i = 0;
    while (i < text.size() && n > 0) {
        ++i;
        while (i < text.size() && is_continuation(static_cast<unsigned char>(text[i]))) ++i;
        --n;
    }
    return i;
}

std::string truncate(std::string_view text, size_t width) {
    if (display_width(text) <= width) return std::string(text);
    return std::string(text.substr(0, prefix_bytes(text, width)));
}

void split_words(std::string_view text, bool partial, std::vector<Word>& out) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find_first_not_of(' ', pos);
        if (start == std::string_view::npos) break;
        size_t end = text.find(' ', start);
        if (end == std::string_view::npos) end = text.size();
        out.push_back({std::string(text.substr(start, end - start)), partial});
        pos = end;
    }
}

std::vector<TranscriptLine> layout(const std::vector<Word>& words, size_t width) {
    std::vector<TranscriptLine> lines;
    if (width == 0) return lines;

    TranscriptLine line;
    size_t used = 0;

    auto flush = [&] {
        lines.push_back(std::move(line));
        line = {};
        used = 0;
    };
    auto append = [&](std::string_view piece, bool partial) {
        auto& target = partial ? line.partial : line.committed;
        if (used > 0) {
            // The separating space belongs to whichever part follows.
            if (partial && line.partial.empty()) line.partial += ' ';
            else target += ' ';
            ++used;
        }
        target += piece;
        used += display_width(piece);
    };

    for (auto& w : words) {
        std::string_view rest = w.text;
        size_t len = display_width(rest);

        if (used > 0 && used + 1 + len > width) flush();

        while (len > width) {
            if (used > 0) flush();
            size_t cut = prefix_bytes(rest, width);
            append(rest.substr(0, cut), w.partial);
            flush();
            rest.remove_prefix(cut);
            len = display_width(rest);
        }
        if (!rest.empty()) append(rest, w.partial);
    }
    if (used > 0) flush();
    return lines;
}

} // namespace

size_t display_width(std::string_view text) {
    return static_cast<size_t>(std::ranges::count_if(
        text, [](char c) { return !is_continuation(static_cast<unsigned char>(c)); }));
}

std::string format_elapsed(std::chrono::milliseconds elapsed) {
    auto total = std::max<int64_t>(0, elapsed.count() / 1000);
    return std::format("{:02}:{:02}:{:02}", total / 3600, (total / 60) % 60, total % 60);
}

std::string_view state_indicator(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "IDLE";
        case SessionState::Recording: return "● RECORDING";
        case SessionState::Paused: return "⏸ PAUSED";
        case SessionState::Reconnecting: return "↻ RECONNECTING";
        case SessionState::SwitchingDevice: return "⇄ SWITCHING";
        case SessionState::Error: return "✖ ERROR";
    }
    return "?";
}

std::string status_line(const SessionStatus& status) {
    std::string line = std::format("{}  {}", state_indicator(status.state),
                                   format_elapsed(status.recorded));
    if (!status.device_name.empty()) {
        line += "  " + status.device_name;
    } else if (!status.device_id.empty()) {
        line += "  " + status.device_id;
    }
    if (status.state == SessionState::Reconnecting && status.reconnect_attempts > 0) {
        line += std::format("  attempt {}", status.reconnect_attempts);
    }
    if (status.dropped > 0) {
        line += std::format("  dropped {}", status.dropped);
    }
    return line;
}

std::vector<std::string> wrap_text(std::string_view text, size_t width) {
    std::vector<Word> words;
    split_words(text, false, words);

    std::vector<std::string> out;
    for (auto& l : layout(words, width)) out.push_back(std::move(l.committed));
    return out;
}

std::vector<TranscriptLine> layout_transcript(const TranscriptSnapshot& snapshot, size_t width) {
    std::vector<Word> words;
    for (auto& seg : snapshot.committed()) split_words(seg.text, false, words);
    if (snapshot.partial) split_words(snapshot.partial->text, true, words);
    return layout(words, width);
}

TranscriptView::TranscriptView(Config::Ui ui) : ui_(std::move(ui)) {}

void TranscriptView::set_devices(std::vector<DeviceDescriptor> devices) {
    devices_ = std::move(devices);
}

void TranscriptView::scroll_up(size_t lines) {
    scroll_ += lines;
}

void TranscriptView::scroll_down(size_t lines) {
    scroll_ = lines >= scroll_ ? 0 : scroll_ - lines;
}

std::string TranscriptView::device_line(const SessionStatus& status, size_t width) const {
    std::string line = "devices:";
    for (auto& d : devices_) {
        auto label = d.name.empty() ? d.id : d.name;
        if (d.id == status.device_id) {
            line += " [" + label + "]";
        } else {
            line += " " + label;
        }
    }
    if (devices_.empty()) line += " (none)";
    return truncate(line, width);
}

std::string TranscriptView::render(const SessionStatus& status,
                                   const TranscriptSnapshot& snapshot, ScreenSize size) {
    const size_t cols = std::max<size_t>(size.cols, 1);
    // Status, devices, message, help.
    const size_t chrome = 4;
    const size_t body_rows = size.rows > chrome ? size.rows - chrome : 0;

    auto lines = layout_transcript(snapshot, cols);
    if (lines.size() > last_line_count_ && ui_.auto_scroll) scroll_ = 0;
    last_line_count_ = lines.size();

    size_t max_scroll = lines.size() > body_rows ? lines.size() - body_rows : 0;
    scroll_ = std::min(scroll_, max_scroll);

    size_t end = lines.size() - scroll_;
    size_t begin = end > body_rows ? end - body_rows : 0;

    auto color = theme_color(ui_.theme);
    std::string out = "\x1b[H";

    auto row = [&out](std::string_view content) {
        out += kClearLine;
        out += content;
        out += "\r\n";
    };

    row(std::format("{}{}{}{}", kBold, color, truncate(status_line(status), cols), kReset));
    row(device_line(status, cols));

    std::string message;
    if (status.state == SessionState::Error && !status.error.empty()) {
        message = status.error;
    } else if (!status.notice.empty()) {
        message = status.notice;
    }
    row(message.empty() ? std::string()
                        : std::format("{}{}{}", kRed, truncate(message, cols), kReset));

    for (size_t i = 0; i < body_rows; ++i) {
        size_t idx = begin + i;
        if (idx >= end) {
            row("");
            continue;
        }
        auto& l = lines[idx];
        if (l.partial.empty()) {
            row(l.committed);
        } else {
            row(std::format("{}{}{}{}", l.committed, kDim, l.partial, kReset));
        }
    }

    out += kClearLine;
    out += kDim;
    out += truncate(kHelp, cols);
    out += kReset;
    return out;
}
