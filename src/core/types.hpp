#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include "constants.hpp"

// Failure categories carried by Result. Callers branch on the kind to decide
// how far a failure propagates (one action, one region, or the whole session).
enum class ErrorKind {
    None,
    Config,             // malformed configuration file
    Auth,               // credentials invalid or absent
    Network,            // endpoint unreachable
    Timeout,            // remote call exceeded its budget
    RegionUnavailable,  // one region could not be fetched
    Action,             // remote refused a start/stop/reboot request
    Rejected,           // refused locally, no remote call issued
    Parse,              // remote output could not be decoded
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Re-wrap another result's failure without its value type
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Child process execution result
struct CommandResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return !timed_out && exit_code == 0; }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures
struct AwsConfig {
    std::string cli = "aws";                // path or name of the aws executable
    std::string profile;                    // empty = default credential chain
    std::string default_region = "us-east-1";
};

struct RefreshConfig {
    int interval_secs = REFRESH_INTERVAL_SECS;
    int stale_ttl_secs = STALE_TTL_SECS;
    int fetch_timeout_secs = FETCH_TIMEOUT_SECS;
    int workers = FETCH_WORKERS;           // concurrent region fetches per tick
    int page_size = DESCRIBE_PAGE_SIZE;     // describe-instances page size
    bool auto_refresh = true;
};

struct PolicyConfig {
    int optimistic_expiry_ticks = OPTIMISTIC_EXPIRY_TICKS;
    int reboot_expiry_ticks = REBOOT_EXPIRY_TICKS;
    int reboot_health_wait_ticks = REBOOT_HEALTH_WAIT_TICKS;
    int eviction_misses = EVICTION_MISS_THRESHOLD;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
