#pragma once

#include "error.hpp"
#include "transcript/transcript_event.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Committed segments form an immutable list, newest first. Snapshots share
// it, so taking one costs the same no matter how long the transcript is.
struct CommittedNode {
    Segment segment;
    std::shared_ptr<const CommittedNode> prev;

    CommittedNode(Segment s, std::shared_ptr<const CommittedNode> p)
        : segment(std::move(s)), prev(std::move(p)) {}
    ~CommittedNode();
};

struct TranscriptSnapshot {
    std::shared_ptr<const CommittedNode> head;
    size_t committed_count = 0;
    uint64_t committed_end = 0;
    std::optional<Segment> partial;

    // Oldest first.
    std::vector<Segment> committed() const;
    // Committed text plus the partial, joined with spaces.
    std::string text() const;
    bool empty() const { return committed_count == 0 && !partial; }
};

// Pure merge step: Partial replaces the trailing partial, Final is appended
// and retires the partial it covers. Anything starting before the committed
// end is rejected with OutOfOrder.
std::expected<TranscriptSnapshot, Error> reduce(const TranscriptSnapshot& state,
                                                const TranscriptEvent& event);

// Single writer (network thread), any number of readers.
class TranscriptLog {
public:
    using CommitListener = std::function<void(const Segment&)>;

    std::expected<void, Error> apply(const TranscriptEvent& event);
    std::expected<void, Error> append_final(const Segment& segment);
    std::expected<void, Error> set_partial(const Segment& segment);

    TranscriptSnapshot snapshot() const;
    uint64_t committed_end() const;
    void clear();

    // Called on the writer thread after each committed segment is published.
    void set_commit_listener(CommitListener listener);

private:
    mutable std::mutex mutex_;
    TranscriptSnapshot state_;
    CommitListener listener_;
};
