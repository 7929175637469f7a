#include "stt/transcription_session.hpp"

static std::string trim(const std::string& text) {
    auto start = text.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = text.find_last_not_of(" \t\n\r");
    return text.substr(start, end - start + 1);
}

TranscriptionSession::TranscriptionSession(TranscriberFactory factory)
    : factory_(std::move(factory)) {}

TranscriptionSession::~TranscriptionSession() {
    close();
}

std::expected<void, Error> TranscriptionSession::open(const Settings& settings,
                                                      const CaptureFormat& format,
                                                      uint64_t base_offset) {
    close();

    transcriber_ = factory_();
    if (!transcriber_) {
        return std::unexpected(Error{ErrorKind::Connect, "no transcriber available"});
    }

    if (auto res = transcriber_->connect(settings, format); !res) {
        transcriber_.reset();
        return std::unexpected(res.error());
    }

    connected_ = true;
    ended_.reset();
    keepalive_ = std::chrono::seconds(settings.keepalive_seconds);
    last_sent_ = std::chrono::steady_clock::now();
    cursor_ = base_offset;
    have_session_ = false;
    flushing_.reset();
    return {};
}

std::expected<void, Error> TranscriptionSession::mark_down(Error err) {
    connected_ = false;
    if (!ended_) ended_ = err;
    return std::unexpected(Error{ErrorKind::Send, err.message});
}

std::expected<void, Error> TranscriptionSession::send(const AudioChunk& chunk) {
    if (!connected_) {
        return std::unexpected(Error{ErrorKind::Send, "connection is down"});
    }

    if (!have_session_ || chunk.capture_session != current_.capture_session) {
        // Flush results of the previous capture session before new audio.
        if (have_session_) {
            if (auto res = transcriber_->finalize(); !res) return mark_down(res.error());
            flushing_ = current_;
        }
        have_session_ = true;
        current_ = ChunkSpan{
            .capture_session = chunk.capture_session,
            .first_seq = chunk.seq,
            .last_seq = chunk.seq,
        };
    }

    if (auto res = transcriber_->send_audio(chunk.samples); !res) {
        return mark_down(res.error());
    }

    current_.last_seq = chunk.seq;
    last_sent_ = std::chrono::steady_clock::now();
    return {};
}

std::expected<std::optional<TranscriptEvent>, Error>
TranscriptionSession::poll_event(std::chrono::milliseconds timeout) {
    if (ended_) {
        return std::unexpected(Error{ErrorKind::Disconnected, ended_->message});
    }
    if (!transcriber_) {
        return std::unexpected(Error{ErrorKind::Disconnected, "not open"});
    }

    auto res = transcriber_->receive(timeout);
    if (!res) {
        connected_ = false;
        ended_ = res.error();
        return std::unexpected(Error{ErrorKind::Disconnected, res.error().message});
    }
    if (!res->has_value()) return std::nullopt;

    auto& result = **res;
    std::string text = trim(result.text);

    // An empty partial carries nothing; an empty final retracts the partial.
    if (text.empty() && !result.is_final) return std::nullopt;

    uint64_t start = cursor_ == 0 ? 0 : cursor_ + 1;
    ChunkSpan& span = flushing_ ? *flushing_ : current_;

    TranscriptEvent event{
        .kind = result.is_final ? EventKind::Final : EventKind::Partial,
        .text = text,
        .start = start,
        .end = start + text.size(),
        .capture_session = span.capture_session,
        .first_seq = span.first_seq,
        .last_seq = span.last_seq,
    };

    if (result.is_final) {
        if (!text.empty()) {
            cursor_ = event.end;
            span.first_seq = span.last_seq + 1;
        }
        if (flushing_ && result.from_finalize) flushing_.reset();
    }
    return event;
}

std::expected<void, Error> TranscriptionSession::maintain() {
    if (!connected_ || keepalive_.count() == 0) return {};

    auto now = std::chrono::steady_clock::now();
    if (now - last_sent_ < keepalive_) return {};

    if (auto res = transcriber_->keep_alive(); !res) {
        return mark_down(res.error());
    }
    last_sent_ = now;
    return {};
}

void TranscriptionSession::close() {
    if (transcriber_) {
        transcriber_->close();
        transcriber_.reset();
    }
    connected_ = false;
    if (!ended_) ended_ = Error{ErrorKind::Disconnected, "session closed"};
}
