#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace browsetrail {

// File name prefix shared by every snapshot; the startup sweep keys on it.
constexpr const char* kSnapshotPrefix = "chrome_history_copy_";
constexpr const char* kSnapshotSuffix = ".sqlite";

// Private point-in-time copy of a history database. The copy is deleted
// when the handle goes out of scope. Move-only; never shared between requests.
class Snapshot {
public:
    // Copy source_path into a freshly named file under temp_dir.
    // Throws HistoryError(SourceNotFound) if the source is missing and
    // HistoryError(CopyFailed) on any I/O failure (partial copy removed).
    static Snapshot create(const std::string& source_path, const std::string& temp_dir);

    ~Snapshot();

    Snapshot(Snapshot&& other) noexcept;
    Snapshot& operator=(Snapshot&&) = delete;
    Snapshot(const Snapshot&) = delete;
    Snapshot& operator=(const Snapshot&) = delete;

    const std::string& path() const { return path_; }
    std::chrono::system_clock::time_point created() const { return created_; }

private:
    Snapshot(std::string path, std::chrono::system_clock::time_point created);

    std::string path_;
    std::chrono::system_clock::time_point created_;
};

// temp_dir from config, or the system temp directory when empty
std::string snapshot_temp_dir(const std::string& configured);

// Unique snapshot file name: prefix, pid, Unix ms, random hex, suffix
std::string make_snapshot_name();

// Delete snapshot files under temp_dir last modified more than max_age_seconds
// ago. Returns the number removed. Failures are logged and skipped.
uint32_t sweep_stale_snapshots(const std::string& temp_dir, uint32_t max_age_seconds);

} // namespace browsetrail
