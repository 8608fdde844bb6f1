#include "history_reader.hpp"
#include "chrome_time.hpp"
#include "snapshot.hpp"

#include <iostream>

namespace browsetrail {

HistoryReader::HistoryReader(const HistoryConfig& config, HostIdentity& identity)
    : config_(config), identity_(identity) {}

std::string HistoryReader::resolve_source() const {
    if (!config_.path.empty()) return config_.path;
    PlatformLocator locator(identity_);
    return locator.resolve().history_file_path;
}

std::vector<HistoryEntry> HistoryReader::read_today(uint32_t limit, std::time_t now) const {
    if (limit == 0) {
        limit = config_.default_limit > 0 ? config_.default_limit : kDefaultHistoryLimit;
    }

    std::string source = resolve_source();
    Snapshot snapshot = Snapshot::create(source, snapshot_temp_dir(config_.temp_dir));

    std::vector<HistoryEntry> entries;
    {
        // Closed before the snapshot file is unlinked
        HistoryDb db(snapshot.path());
        int64_t since_raw = unix_ms_to_webkit(local_midnight_unix_ms(now));
        entries = db.query_recent(since_raw, limit);
    }

    std::cerr << "[history] " << entries.size() << " entr"
              << (entries.size() == 1 ? "y" : "ies") << " since local midnight\n";
    return entries;
}

std::string format_history(const std::vector<HistoryEntry>& entries) {
    if (entries.empty()) return kNoHistoryMessage;

    std::string out;
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        if (i > 0) out += "\n";
        out += "## " + e.title + "\n";
        out += "  - URL: " + e.url + "\n";
        out += "  - Visited At: " + e.visit_time_local + "\n";
    }
    return out;
}

} // namespace browsetrail
