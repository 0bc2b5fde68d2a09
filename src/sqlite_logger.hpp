#pragma once
#include "segmentation/segment_tracker.hpp"
#include "segmentation/speech_event.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>

namespace vadseg {

// Session/event store for speech segmentation runs.
// Schema:
//  - sessions(id INTEGER PK, started_ms INTEGER, ended_ms INTEGER,
//             sample_rate INTEGER, total_samples INTEGER)
//  - speech_events(id INTEGER PK, session_id INTEGER, ts_ms INTEGER,
//                  kind TEXT, offset_samples INTEGER)
//  - speech_segments(id INTEGER PK, session_id INTEGER, start_sample INTEGER,
//                    end_sample INTEGER, frame_count INTEGER)
//
// Notes:
//  * ts_ms is steady_clock millis and only orders rows; the stream timeline
//    is offset_samples.
//  * Not thread-safe. Use one logger per thread.
class SessionLogger {
public:
    explicit SessionLogger(const std::string& db_path);
    ~SessionLogger();
    SessionLogger(const SessionLogger&) = delete;
    SessionLogger& operator=(const SessionLogger&) = delete;

    // Begins a session; returns the new session id.
    std::int64_t start_session(int sample_rate);

    // Marks end time and stream length for a session.
    void end_session(std::int64_t session_id, std::int64_t total_samples);

    void log_event(std::int64_t session_id, const SpeechEvent& event);
    void log_segment(std::int64_t session_id, const Segment& segment);

    std::int64_t count_events(std::int64_t session_id) const;
    std::int64_t count_segments(std::int64_t session_id) const;

    const std::string& path() const { return db_path_; }

private:
    struct StatementDeleter {
        void operator()(sqlite3_stmt* st) { if (st) sqlite3_finalize(st); }
    };
    using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    void init_schema();
    Statement prepare(const char* sql) const;
    void step_done(sqlite3_stmt* st, const char* what) const;
    std::int64_t count_rows(const char* sql, std::int64_t session_id) const;
    static std::int64_t now_ms();

    std::string db_path_;
    sqlite3* db_ = nullptr;
};

} // namespace vadseg
