#pragma once

#include <string>
#include <chrono>

// Format an elapsed duration as "2h35m", "14m22s" or "8s".
// Negative durations clamp to "0s".
std::string format_age(std::chrono::seconds age);

// Age of a snapshot taken at `as_of`, relative to `now`.
// Returns "-" for a default-constructed (never set) time point.
std::string format_snapshot_age(std::chrono::system_clock::time_point as_of,
                                std::chrono::system_clock::time_point now);

// Format a remote launch timestamp ("2025-01-15T14:35:22.000Z") for display
// as local "YYYY-MM-DD HH:MM:SS". Returns "N/A" if empty, "?" on parse failure.
std::string format_launch_time(const std::string& iso_time);
