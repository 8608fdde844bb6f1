#include "history_db.hpp"
#include "chrome_time.hpp"
#include "history_error.hpp"

#include <iostream>
#include <sqlite3.h>
#include <utility>

namespace browsetrail {

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

const char* kRecentQuery =
    "SELECT title, url, last_visit_time "
    "FROM urls "
    "WHERE last_visit_time > ? "
    "ORDER BY last_visit_time DESC "
    "LIMIT ?;";

} // namespace

HistoryDb::HistoryDb(const std::string& snapshot_path) : path_(snapshot_path) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw HistoryError(HistoryErrorCode::OpenFailed,
                           "Failed to open history snapshot " + path_ + ": " + err);
    }

    // sqlite3_open_v2 is lazy; touching the schema surfaces corrupt or
    // non-database files here rather than at query time.
    rc = sqlite3_exec(db_, "SELECT count(*) FROM sqlite_master;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        std::string err = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw HistoryError(HistoryErrorCode::OpenFailed,
                           "Failed to open history snapshot " + path_ + ": " + err);
    }
}

HistoryDb::~HistoryDb() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        std::cerr << "[history] Closed SQLite database connection.\n";
    }
}

std::vector<HistoryEntry> HistoryDb::query_recent(int64_t since_raw, uint32_t limit) const {
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, kRecentQuery, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw HistoryError(HistoryErrorCode::QueryFailed,
                           std::string("Failed to query history: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_int64(g.stmt, 1, since_raw);
    sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(limit));

    std::vector<HistoryEntry> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        HistoryEntry entry;
        if (auto* v = sqlite3_column_text(g.stmt, 0)) entry.title = reinterpret_cast<const char*>(v);
        if (entry.title.empty()) entry.title = kNoTitle;
        if (auto* v = sqlite3_column_text(g.stmt, 1)) entry.url = reinterpret_cast<const char*>(v);
        entry.visit_time_raw = sqlite3_column_int64(g.stmt, 2);
        entry.visit_time_unix_ms = webkit_to_unix_ms(entry.visit_time_raw);
        entry.visit_time_local = format_local_time(entry.visit_time_unix_ms);
        results.push_back(std::move(entry));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw HistoryError(HistoryErrorCode::QueryFailed,
                           std::string("Failed to read history rows: ") + sqlite3_errmsg(db_));
    }
    return results;
}

} // namespace browsetrail
