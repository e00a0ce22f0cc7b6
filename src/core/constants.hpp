#pragma once

// ── Control markers ─────────────────────────────────────────
// Well-known marker locations shared by every instance and by monitoring tools.
constexpr const char* DEFAULT_RUNNING_FLAG = "/mnt/.backup_running";
constexpr const char* DEFAULT_FAIL_FLAG    = "/mnt/.backup_failed";
constexpr const char* DEFAULT_STOP_FLAG    = "/mnt/.backup_stop";

// ── Copier ──────────────────────────────────────────────────
constexpr const char* DEFAULT_RSYNC_PATH   = "rsync";
constexpr const char* DEFAULT_RSYNC_OPTS   = "-a";
constexpr int EXEC_FAILED_EXIT_CODE        = 127;   // same as a shell's "command not found"

// ── Scheduling ──────────────────────────────────────────────
constexpr int DEFAULT_MAX_PARALLEL         = 1;     // 1 = sequential mode
constexpr int JOB_POLL_INTERVAL_MS         = 2000;  // Interval between in-flight job checks
constexpr int POLL_SLICE_MS                = 100;   // Sleep granularity for responsive interrupts

// ── Files ───────────────────────────────────────────────────
constexpr const char* DEFAULT_CONFIG_NAME  = "backup_config.yaml";
constexpr const char* BACKSET_VERSION      = "0.2.0";
