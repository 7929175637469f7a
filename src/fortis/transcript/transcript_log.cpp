#include "transcript/transcript_log.hpp"

#include <algorithm>
#include <format>

CommittedNode::~CommittedNode() {
    // Unlink iteratively so a long transcript doesn't recurse on teardown.
    auto p = std::const_pointer_cast<CommittedNode>(std::move(prev));
    while (p && p.use_count() == 1) {
        auto next = std::const_pointer_cast<CommittedNode>(std::move(p->prev));
        p = std::move(next);
    }
}

std::vector<Segment> TranscriptSnapshot::committed() const {
    std::vector<Segment> out;
    out.reserve(committed_count);
    for (auto* n = head.get(); n; n = n->prev.get()) {
        out.push_back(n->segment);
    }
    std::ranges::reverse(out);
    return out;
}

std::string TranscriptSnapshot::text() const {
    std::string out;
    for (auto& s : committed()) {
        if (!out.empty()) out += ' ';
        out += s.text;
    }
    if (partial && !partial->text.empty()) {
        if (!out.empty()) out += ' ';
        out += partial->text;
    }
    return out;
}

std::expected<TranscriptSnapshot, Error> reduce(const TranscriptSnapshot& state,
                                                const TranscriptEvent& event) {
    if (event.end < event.start) {
        return std::unexpected(Error{ErrorKind::OutOfOrder,
                                     std::format("segment end {} before start {}",
                                                 event.end, event.start)});
    }
    if (event.start < state.committed_end) {
        return std::unexpected(Error{ErrorKind::OutOfOrder,
                                     std::format("segment at {} precedes committed end {}",
                                                 event.start, state.committed_end)});
    }

    TranscriptSnapshot next = state;
    Segment seg{
        .text = event.text,
        .start = event.start,
        .end = event.end,
        .capture_session = event.capture_session,
        .first_seq = event.first_seq,
        .last_seq = event.last_seq,
    };

    if (event.kind == EventKind::Partial) {
        next.partial = std::move(seg);
        return next;
    }

    if (next.partial && (next.partial->start < event.end || next.partial->start == event.start)) {
        next.partial.reset();
    }

    // An empty final only retracts the partial.
    if (event.text.empty()) return next;

    next.head = std::make_shared<const CommittedNode>(std::move(seg), state.head);
    next.committed_count = state.committed_count + 1;
    next.committed_end = event.end;
    return next;
}

std::expected<void, Error> TranscriptLog::apply(const TranscriptEvent& event) {
    std::optional<Segment> committed;
    CommitListener listener;
    {
        std::lock_guard lock(mutex_);
        auto next = reduce(state_, event);
        if (!next) return std::unexpected(next.error());

        if (next->committed_count != state_.committed_count) {
            committed = next->head->segment;
            listener = listener_;
        }
        state_ = std::move(*next);
    }

    if (committed && listener) listener(*committed);
    return {};
}

std::expected<void, Error> TranscriptLog::append_final(const Segment& segment) {
    return apply(TranscriptEvent{
        .kind = EventKind::Final,
        .text = segment.text,
        .start = segment.start,
        .end = segment.end,
        .capture_session = segment.capture_session,
        .first_seq = segment.first_seq,
        .last_seq = segment.last_seq,
    });
}

std::expected<void, Error> TranscriptLog::set_partial(const Segment& segment) {
    return apply(TranscriptEvent{
        .kind = EventKind::Partial,
        .text = segment.text,
        .start = segment.start,
        .end = segment.end,
        .capture_session = segment.capture_session,
        .first_seq = segment.first_seq,
        .last_seq = segment.last_seq,
    });
}

TranscriptSnapshot TranscriptLog::snapshot() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint64_t TranscriptLog::committed_end() const {
    std::lock_guard lock(mutex_);
    return state_.committed_end;
}

void TranscriptLog::clear() {
    std::lock_guard lock(mutex_);
    state_ = TranscriptSnapshot{};
}

void TranscriptLog::set_commit_listener(CommitListener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}
