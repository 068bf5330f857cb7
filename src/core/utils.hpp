#pragma once

#include <string>
#include <chrono>
#include <ctime>

// Format a wall-clock time point as a local ISO 8601 timestamp.
std::string to_iso(std::chrono::system_clock::time_point tp);

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
// A trailing "Z" or "+00:00" marks UTC; anything else is read as local time.
std::time_t parse_iso_time(const std::string& iso);

// Lowercase copy (ASCII only).
std::string to_lower(std::string s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
