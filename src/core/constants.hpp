#pragma once

#include <cstddef>

// ── Stream retry defaults ───────────────────────────────────
constexpr int DEFAULT_RETRY_LIMIT        = 5;     // Attempts per stream_logs() call
constexpr int DEFAULT_RETRY_DELAY_MS     = 1000;  // Pause between failed attempts

// ── Readiness polling ───────────────────────────────────────
constexpr int READY_POLL_MS              = 1000;  // Between pod status queries
constexpr int READY_TIMEOUT_SECS         = 600;   // Give up waiting for a pod after 10 min

// ── Timeouts ────────────────────────────────────────────────
constexpr int KUBECTL_CMD_TIMEOUT_SECS   = 30;    // Max time for a non-streaming kubectl call
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;
constexpr int SSH_EAGAIN_SLEEP_MS        = 10;    // Backoff while libssh2 returns EAGAIN
constexpr int PROCESS_TERM_GRACE_MS      = 2000;  // SIGTERM -> SIGKILL window
constexpr int CMD_POLL_SLICE_MS          = 200;   // Cancel check interval while a command runs

// ── Buffer sizes ────────────────────────────────────────────
constexpr int STREAM_READ_BUF_SIZE       = 4096;
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr size_t STDERR_TAIL_BYTES       = 8192;  // stderr kept from a streaming command

// ── Paths ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME    = ".logtap";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* DEBUG_LOG_NAME     = "logtap_debug.log";

constexpr const char* LOGTAP_VERSION     = "0.1.0";
