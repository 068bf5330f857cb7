#pragma once

#include <cstddef>

// ── Refresh cadence ─────────────────────────────────────────
constexpr int REFRESH_INTERVAL_SECS      = 30;    // Periodic scan interval
constexpr int STALE_TTL_SECS             = 60;    // Snapshot age before a region counts as stale
constexpr int FETCH_TIMEOUT_SECS         = 10;    // Budget for all pages of one region fetch
constexpr int FETCH_WORKERS              = 4;     // Concurrent region fetches per tick
constexpr int DESCRIBE_PAGE_SIZE         = 100;   // describe-instances --max-results
constexpr int ACTION_TIMEOUT_SECS        = 15;    // start/stop/reboot request budget
constexpr int CATALOG_TIMEOUT_SECS       = 15;    // describe-regions budget

// ── Optimistic overlay / eviction policy ────────────────────
constexpr int OPTIMISTIC_EXPIRY_TICKS    = 2;
constexpr int REBOOT_EXPIRY_TICKS        = 1;
constexpr int REBOOT_HEALTH_WAIT_TICKS   = 10;    // ticks to wait on status checks after a reboot
constexpr int EVICTION_MISS_THRESHOLD    = 3;

// ── Change feed ─────────────────────────────────────────────
constexpr size_t CHANGE_FEED_RETAIN      = 1024;  // events kept for cursor replay

// ── Local paths ─────────────────────────────────────────────
constexpr const char* APP_DIR_NAME       = ".ec2ctl";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* STATE_FILE_NAME    = "state.yaml";
constexpr const char* DEBUG_LOG_NAME     = "ec2ctl_debug.log";

constexpr const char* EC2CTL_VERSION     = "0.4.0";
