#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct RunRecord {
    std::string kind;        // "run" or "record"
    std::string macro_path;
    int64_t steps_total = 0;
    int64_t steps_executed = 0;
    int64_t degraded = 0;
    std::optional<int64_t> failed_step;
    std::string error;
    double duration = 0.0;   // seconds
};

struct RunEntry {
    int64_t id = 0;
    std::string timestamp;
    RunRecord record;
};

class RunHistory {
public:
    RunHistory();
    ~RunHistory();

    RunHistory(const RunHistory&) = delete;
    RunHistory& operator=(const RunHistory&) = delete;

    bool open(const std::string& path);
    void close();

    bool insert(const RunRecord& record);

    // Newest first.
    std::vector<RunEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
