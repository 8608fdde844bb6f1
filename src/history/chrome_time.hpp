#pragma once
#include <cstdint>
#include <ctime>
#include <string>

namespace browsetrail {

// Milliseconds between 1601-01-01T00:00:00Z and 1970-01-01T00:00:00Z.
// Chrome stores visit times as microseconds since the former.
constexpr int64_t kWebkitEpochOffsetMs = 11644473600000LL;

// Chrome microseconds -> Unix milliseconds
constexpr int64_t webkit_to_unix_ms(int64_t raw) {
    return raw / 1000 - kWebkitEpochOffsetMs;
}

// Unix milliseconds -> Chrome microseconds
constexpr int64_t unix_ms_to_webkit(int64_t unix_ms) {
    return (unix_ms + kWebkitEpochOffsetMs) * 1000;
}

// Unix milliseconds of 00:00:00 local time on the day containing `now`.
int64_t local_midnight_unix_ms(std::time_t now);

// Render Unix milliseconds as local "YYYY/MM/DD HH:MM:SS".
std::string format_local_time(int64_t unix_ms);

} // namespace browsetrail
