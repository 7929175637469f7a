#pragma once

#include "transcript/transcript_event.hpp"

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

// Where a committed segment came from.
struct ArchiveContext {
    std::string device;
    std::string language;
    std::string model;
};

struct ArchivedSegment {
    int64_t id;
    std::string timestamp;
    std::string text;
    uint64_t capture_session;
    uint64_t start;
    uint64_t end;
    std::string device;
    std::string language;
    std::string model;
};

class TranscriptArchive {
public:
    TranscriptArchive();
    ~TranscriptArchive();

    TranscriptArchive(const TranscriptArchive&) = delete;
    TranscriptArchive& operator=(const TranscriptArchive&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    bool insert(const Segment& segment, const ArchiveContext& context);

    // Newest first.
    std::vector<ArchivedSegment> recent(int limit = 10);

private:
    bool create_tables();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
