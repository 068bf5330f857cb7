#include "utils.hpp"
#include "types.hpp"
#include <cctype>
#include <cstdio>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "ok";
        case ErrorKind::Config:            return "config";
        case ErrorKind::Auth:              return "auth";
        case ErrorKind::Network:           return "network";
        case ErrorKind::Timeout:           return "timeout";
        case ErrorKind::RegionUnavailable: return "region-unavailable";
        case ErrorKind::Action:            return "action";
        case ErrorKind::Rejected:          return "rejected";
        case ErrorKind::Parse:             return "parse";
    }
    return "unknown";
}

std::string to_iso(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) != 6) {
        return 0;
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;

    // AWS reports LaunchTime in UTC ("...Z" or "...+00:00")
    bool utc = !iso.empty() && (iso.back() == 'Z' ||
               iso.find("+00:00", 19) != std::string::npos);
    if (utc) {
        return timegm(&tm_buf);
    }
    tm_buf.tm_isdst = -1;
    return mktime(&tm_buf);
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}
