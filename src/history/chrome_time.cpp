#include "chrome_time.hpp"

namespace browsetrail {

int64_t local_midnight_unix_ms(std::time_t now) {
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    tm_buf.tm_hour = 0;
    tm_buf.tm_min = 0;
    tm_buf.tm_sec = 0;
    tm_buf.tm_isdst = -1; // let mktime resolve DST for midnight itself
    std::time_t midnight = std::mktime(&tm_buf);
    return static_cast<int64_t>(midnight) * 1000;
}

std::string format_local_time(int64_t unix_ms) {
    // Floor toward negative infinity so pre-1970 values land on the right second
    int64_t secs = unix_ms / 1000;
    if (unix_ms % 1000 < 0) --secs;
    std::time_t t = static_cast<std::time_t>(secs);

    std::tm tm_buf{};
    if (!localtime_r(&t, &tm_buf)) return {};
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y/%m/%d %H:%M:%S", &tm_buf);
    return buf;
}

} // namespace browsetrail
