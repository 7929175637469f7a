#include "storage/transcript_archive.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

TranscriptArchive::TranscriptArchive() = default;

TranscriptArchive::~TranscriptArchive() {
    close();
}

bool TranscriptArchive::open(const std::string& path) {
    close();
    std::lock_guard lock(mutex_);

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "archive: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // The network thread writes while the UI may read.
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO segments (text, capture_session, start_offset, end_offset, "
        "device, language, model) VALUES (?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, text, capture_session, start_offset, end_offset, "
        "device, language, model FROM segments ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "archive: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "archive: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void TranscriptArchive::close() {
    std::lock_guard lock(mutex_);
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool TranscriptArchive::is_open() const {
    std::lock_guard lock(mutex_);
    return insert_stmt_ != nullptr;
}

bool TranscriptArchive::insert(const Segment& segment, const ArchiveContext& ctx) {
    std::lock_guard lock(mutex_);
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, segment.text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(insert_stmt_, 2, static_cast<sqlite3_int64>(segment.capture_session));
    sqlite3_bind_int64(insert_stmt_, 3, static_cast<sqlite3_int64>(segment.start));
    sqlite3_bind_int64(insert_stmt_, 4, static_cast<sqlite3_int64>(segment.end));

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    bind_nullable(5, ctx.device);
    bind_nullable(6, ctx.language);
    bind_nullable(7, ctx.model);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "archive: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<ArchivedSegment> TranscriptArchive::recent(int limit) {
    std::lock_guard lock(mutex_);
    std::vector<ArchivedSegment> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        ArchivedSegment e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.text = get_text(recent_stmt_, 2);
        e.capture_session = static_cast<uint64_t>(sqlite3_column_int64(recent_stmt_, 3));
        e.start = static_cast<uint64_t>(sqlite3_column_int64(recent_stmt_, 4));
        e.end = static_cast<uint64_t>(sqlite3_column_int64(recent_stmt_, 5));
        e.device = get_text(recent_stmt_, 6);
        e.language = get_text(recent_stmt_, 7);
        e.model = get_text(recent_stmt_, 8);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool TranscriptArchive::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS segments (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            text TEXT NOT NULL,
            capture_session INTEGER NOT NULL,
            start_offset INTEGER NOT NULL,
            end_offset INTEGER NOT NULL,
            device TEXT,
            language TEXT,
            model TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "archive: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
