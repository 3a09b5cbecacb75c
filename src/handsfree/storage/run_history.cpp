#include "storage/run_history.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

RunHistory::RunHistory() = default;

RunHistory::~RunHistory() {
    close();
}

bool RunHistory::open(const std::string& path) {
    fs::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            std::println(stderr, "history: cannot create {}: {}", p.parent_path().string(), ec.message());
            return false;
        }
    }

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::println(stderr, "history: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::println(stderr, "history: WAL unavailable: {}", sqlite3_errmsg(db_));
    }

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO runs (kind, macro_path, steps_total, steps_executed, "
        "degraded, failed_step, error, duration) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, kind, macro_path, steps_total, steps_executed, "
        "degraded, failed_step, error, duration "
        "FROM runs ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "history: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "history: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void RunHistory::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool RunHistory::insert(const RunRecord& r) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, r.kind.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(2, r.macro_path);
    sqlite3_bind_int64(insert_stmt_, 3, r.steps_total);
    sqlite3_bind_int64(insert_stmt_, 4, r.steps_executed);
    sqlite3_bind_int64(insert_stmt_, 5, r.degraded);
    if (r.failed_step) sqlite3_bind_int64(insert_stmt_, 6, *r.failed_step);
    else sqlite3_bind_null(insert_stmt_, 6);
    bind_nullable(7, r.error);
    sqlite3_bind_double(insert_stmt_, 8, r.duration);

    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        std::println(stderr, "history: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<RunEntry> RunHistory::recent(int limit) {
    std::vector<RunEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        RunEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.record.kind = get_text(recent_stmt_, 2);
        e.record.macro_path = get_text(recent_stmt_, 3);
        e.record.steps_total = sqlite3_column_int64(recent_stmt_, 4);
        e.record.steps_executed = sqlite3_column_int64(recent_stmt_, 5);
        e.record.degraded = sqlite3_column_int64(recent_stmt_, 6);
        if (sqlite3_column_type(recent_stmt_, 7) != SQLITE_NULL) {
            e.record.failed_step = sqlite3_column_int64(recent_stmt_, 7);
        }
        e.record.error = get_text(recent_stmt_, 8);
        e.record.duration = sqlite3_column_double(recent_stmt_, 9);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool RunHistory::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            kind TEXT NOT NULL,
            macro_path TEXT,
            steps_total INTEGER NOT NULL DEFAULT 0,
            steps_executed INTEGER NOT NULL DEFAULT 0,
            degraded INTEGER NOT NULL DEFAULT 0,
            failed_step INTEGER,
            error TEXT,
            duration REAL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "history: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
