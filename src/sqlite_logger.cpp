#include "sqlite_logger.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace vadseg {

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

SessionLogger::SessionLogger(const std::string& db_path) : db_path_(db_path) {
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open SQLite DB at " + db_path + ": " + msg);
    }
    try {
        init_schema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SessionLogger::~SessionLogger() {
    if (db_) sqlite3_close(db_);
}

void SessionLogger::init_schema() {
    const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS sessions (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        started_ms INTEGER NOT NULL,
        ended_ms INTEGER,
        sample_rate INTEGER NOT NULL,
        total_samples INTEGER DEFAULT 0
    );
    CREATE TABLE IF NOT EXISTS speech_events (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        session_id INTEGER NOT NULL,
        ts_ms INTEGER NOT NULL,
        kind TEXT NOT NULL,
        offset_samples INTEGER NOT NULL,
        FOREIGN KEY(session_id) REFERENCES sessions(id)
    );
    CREATE TABLE IF NOT EXISTS speech_segments (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        session_id INTEGER NOT NULL,
        start_sample INTEGER NOT NULL,
        end_sample INTEGER NOT NULL,
        frame_count INTEGER NOT NULL,
        FOREIGN KEY(session_id) REFERENCES sessions(id)
    );
    )SQL";
    exec_sql(db_, schema);
}

SessionLogger::Statement SessionLogger::prepare(const char* sql) const {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        throw std::runtime_error(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db_));
    }
    return Statement(st);
}

void SessionLogger::step_done(sqlite3_stmt* st, const char* what) const {
    if (sqlite3_step(st) != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to ") + what + ": " + sqlite3_errmsg(db_));
    }
}

std::int64_t SessionLogger::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

std::int64_t SessionLogger::start_session(int sample_rate) {
    auto st = prepare("INSERT INTO sessions (started_ms, sample_rate) VALUES (?, ?);");
    sqlite3_bind_int64(st.get(), 1, now_ms());
    sqlite3_bind_int(st.get(), 2, sample_rate);
    step_done(st.get(), "insert session");
    return sqlite3_last_insert_rowid(db_);
}

void SessionLogger::end_session(std::int64_t session_id, std::int64_t total_samples) {
    auto st = prepare("UPDATE sessions SET ended_ms=?, total_samples=? WHERE id=?;");
    sqlite3_bind_int64(st.get(), 1, now_ms());
    sqlite3_bind_int64(st.get(), 2, total_samples);
    sqlite3_bind_int64(st.get(), 3, session_id);
    step_done(st.get(), "end session");
}

void SessionLogger::log_event(std::int64_t session_id, const SpeechEvent& event) {
    auto st = prepare(
        "INSERT INTO speech_events (session_id, ts_ms, kind, offset_samples) VALUES (?, ?, ?, ?);");
    sqlite3_bind_int64(st.get(), 1, session_id);
    sqlite3_bind_int64(st.get(), 2, now_ms());
    sqlite3_bind_text(st.get(), 3, toString(event.type), -1, SQLITE_STATIC);
    sqlite3_bind_int64(st.get(), 4, event.offsetSamples);
    step_done(st.get(), "insert speech event");
}

void SessionLogger::log_segment(std::int64_t session_id, const Segment& segment) {
    auto st = prepare(
        "INSERT INTO speech_segments (session_id, start_sample, end_sample, frame_count) "
        "VALUES (?, ?, ?, ?);");
    sqlite3_bind_int64(st.get(), 1, session_id);
    sqlite3_bind_int64(st.get(), 2, segment.startSample);
    sqlite3_bind_int64(st.get(), 3, segment.endSample);
    sqlite3_bind_int(st.get(), 4, segment.frameCount);
    step_done(st.get(), "insert speech segment");
}

std::int64_t SessionLogger::count_rows(const char* sql, std::int64_t session_id) const {
    auto st = prepare(sql);
    sqlite3_bind_int64(st.get(), 1, session_id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("SQLite count failed: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_column_int64(st.get(), 0);
}

std::int64_t SessionLogger::count_events(std::int64_t session_id) const {
    return count_rows("SELECT COUNT(*) FROM speech_events WHERE session_id=?;", session_id);
}

std::int64_t SessionLogger::count_segments(std::int64_t session_id) const {
    return count_rows("SELECT COUNT(*) FROM speech_segments WHERE session_id=?;", session_id);
}

} // namespace vadseg
