#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct sqlite3; // forward declare

namespace browsetrail {

// Placeholder for rows whose title is NULL or empty
constexpr const char* kNoTitle = "No Title";

struct HistoryEntry {
    std::string title;
    std::string url;
    int64_t visit_time_raw = 0;       // Chrome microseconds since 1601
    int64_t visit_time_unix_ms = 0;
    std::string visit_time_local;     // "YYYY/MM/DD HH:MM:SS"
};

// Read-only connection to a snapshot of Chrome's History database.
class HistoryDb {
public:
    // Throws HistoryError(OpenFailed) if the file cannot be opened as SQLite.
    explicit HistoryDb(const std::string& snapshot_path);
    ~HistoryDb();

    // Non-copyable
    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    // Up to `limit` urls rows with last_visit_time > since_raw, newest first.
    // Throws HistoryError(QueryFailed).
    std::vector<HistoryEntry> query_recent(int64_t since_raw, uint32_t limit) const;

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

} // namespace browsetrail
