#include "snapshot.hpp"
#include "history_error.hpp"
#include "../util.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace browsetrail {

namespace {

// Closes a POSIX fd on scope exit
struct FdGuard {
    int fd = -1;
    ~FdGuard() { if (fd >= 0) ::close(fd); }
};

bool write_all(int fd, const char* data, size_t len) {
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

// Byte copy from src_fd to dst_fd. Returns "" on success, else the error text.
std::string copy_fd(int src_fd, int dst_fd) {
    std::array<char, 64 * 1024> buffer;
    while (true) {
        ssize_t n = ::read(src_fd, buffer.data(), buffer.size());
        if (n == 0) return {};
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::string("read failed: ") + std::strerror(errno);
        }
        if (!write_all(dst_fd, buffer.data(), static_cast<size_t>(n))) {
            return std::string("write failed: ") + std::strerror(errno);
        }
    }
}

} // namespace

std::string snapshot_temp_dir(const std::string& configured) {
    if (!configured.empty()) return configured;
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) return "/tmp";
    return dir.string();
}

std::string make_snapshot_name() {
    return std::string(kSnapshotPrefix) + std::to_string(::getpid()) + "_" +
           std::to_string(epoch_millis()) + "_" + generate_id() + kSnapshotSuffix;
}

Snapshot Snapshot::create(const std::string& source_path, const std::string& temp_dir) {
    std::error_code ec;
    if (!std::filesystem::exists(source_path, ec)) {
        throw HistoryError(HistoryErrorCode::SourceNotFound,
                           "Chrome history file not found: " + source_path);
    }

    FdGuard src;
    src.fd = ::open(source_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (src.fd < 0) {
        throw HistoryError(HistoryErrorCode::CopyFailed,
                           "Failed to open history file " + source_path + ": " +
                           std::strerror(errno));
    }

    // O_EXCL: a name collision fails instead of clobbering another request's copy
    std::string dest;
    FdGuard dst;
    for (int attempt = 0; attempt < 4 && dst.fd < 0; ++attempt) {
        dest = (std::filesystem::path(temp_dir) / make_snapshot_name()).string();
        dst.fd = ::open(dest.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (dst.fd < 0 && errno != EEXIST) break;
    }
    if (dst.fd < 0) {
        throw HistoryError(HistoryErrorCode::CopyFailed,
                           "Failed to create temporary copy in " + temp_dir + ": " +
                           std::strerror(errno));
    }

    std::string err = copy_fd(src.fd, dst.fd);
    int out_fd = dst.fd;
    dst.fd = -1;
    if (::close(out_fd) != 0 && err.empty()) {
        err = std::string("close failed: ") + std::strerror(errno);
    }

    if (!err.empty()) {
        std::filesystem::remove(dest, ec);
        if (ec) {
            std::cerr << "[history] Failed to remove partial copy " << dest
                      << ": " << ec.message() << "\n";
        }
        throw HistoryError(HistoryErrorCode::CopyFailed,
                           "Failed to copy history file " + source_path + ": " + err);
    }

    std::cerr << "[history] Copied history DB to temporary path: " << dest << "\n";
    return Snapshot(std::move(dest), std::chrono::system_clock::now());
}

Snapshot::Snapshot(std::string path, std::chrono::system_clock::time_point created)
    : path_(std::move(path)), created_(created) {}

Snapshot::Snapshot(Snapshot&& other) noexcept
    : path_(std::move(other.path_)), created_(other.created_) {
    other.path_.clear();
}

Snapshot::~Snapshot() {
    if (path_.empty()) return;
    std::error_code ec;
    if (std::filesystem::remove(path_, ec)) {
        std::cerr << "[history] Deleted temporary history DB copy: " << path_ << "\n";
    } else if (ec) {
        std::cerr << "[history] Failed to delete temporary history DB copy "
                  << path_ << ": " << ec.message() << "\n";
    }
}

uint32_t sweep_stale_snapshots(const std::string& temp_dir, uint32_t max_age_seconds) {
    if (max_age_seconds == 0) return 0;

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::directory_iterator it(temp_dir, ec);
    if (ec) {
        std::cerr << "[history] Snapshot sweep skipped, cannot list " << temp_dir
                  << ": " << ec.message() << "\n";
        return 0;
    }

    const auto cutoff = fs::file_time_type::clock::now() -
                        std::chrono::seconds(max_age_seconds);
    const std::string prefix = kSnapshotPrefix;
    const std::string suffix = kSnapshotSuffix;
    uint32_t removed = 0;

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const std::string name = it->path().filename().string();
        if (name.size() <= prefix.size() + suffix.size() ||
            name.compare(0, prefix.size(), prefix) != 0 ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;
        auto mtime = it->last_write_time(entry_ec);
        if (entry_ec || mtime >= cutoff) continue;

        if (fs::remove(it->path(), entry_ec)) {
            ++removed;
        } else if (entry_ec) {
            std::cerr << "[history] Failed to remove stale snapshot "
                      << it->path().string() << ": " << entry_ec.message() << "\n";
        }
    }

    if (removed > 0) {
        std::cerr << "[history] Removed " << removed << " stale snapshot(s) from "
                  << temp_dir << "\n";
    }
    return removed;
}

} // namespace browsetrail
