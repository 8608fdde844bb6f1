#pragma once
#include "history_db.hpp"
#include "platform.hpp"
#include "../config.hpp"
#include <ctime>
#include <string>
#include <vector>

namespace browsetrail {

constexpr uint32_t kDefaultHistoryLimit = 10;
constexpr const char* kNoHistoryMessage = "No browsing history found.";

// Locate, snapshot and query the Chrome history for one request.
// Holds no state between calls; safe to use from concurrent requests.
class HistoryReader {
public:
    HistoryReader(const HistoryConfig& config, HostIdentity& identity);

    // Configured override path, or the platform default profile
    std::string resolve_source() const;

    // Entries visited since local midnight of `now`, newest first.
    // limit == 0 selects the configured default. Throws HistoryError.
    std::vector<HistoryEntry> read_today(uint32_t limit, std::time_t now) const;

private:
    const HistoryConfig& config_;
    HostIdentity& identity_;
};

// Render entries as markdown-ish blocks, or the no-history message
std::string format_history(const std::vector<HistoryEntry>& entries);

} // namespace browsetrail
