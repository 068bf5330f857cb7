#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <ctime>

std::string format_age(std::chrono::seconds age) {
    long long seconds = age.count();
    if (seconds < 0) seconds = 0;
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_snapshot_age(std::chrono::system_clock::time_point as_of,
                                std::chrono::system_clock::time_point now) {
    if (as_of.time_since_epoch().count() == 0) return "-";
    return format_age(std::chrono::duration_cast<std::chrono::seconds>(now - as_of));
}

std::string format_launch_time(const std::string& iso_time) {
    if (iso_time.empty()) return "N/A";

    std::time_t t = parse_iso_time(iso_time);
    if (t == 0) return "?";

    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}
