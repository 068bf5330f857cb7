#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <mutex>
#include <filesystem>
#include <platform/platform.hpp>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <fmt/format.h>

inline std::string ec2ctl_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    return path;
}

// Append a timestamped line to the debug log. Safe to call from worker threads.
inline void ec2ctl_log(const std::string& msg) {
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);

    std::ofstream out(ec2ctl_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void ec2ctl_log_cmd(const std::string& label, const std::string& cmd,
                           const CommandResult& r) {
    ec2ctl_log(fmt::format("{} CMD: {}", label, cmd));
    ec2ctl_log(fmt::format("{} exit={} timed_out={} stdout({})={}", label, r.exit_code,
                           r.timed_out, r.stdout_data.size(), r.stdout_data.substr(0, 300)));
    if (!r.stderr_data.empty())
        ec2ctl_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
