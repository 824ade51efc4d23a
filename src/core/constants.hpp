#pragma once

#include <cstdint>

constexpr const char* REXEC_VERSION = "0.4.0";

// ── Security defaults ───────────────────────────────────────
constexpr int DEFAULT_CHARACTER_LIMIT        = 25000;
constexpr int64_t DEFAULT_MAX_FILE_SIZE      = 10LL * 1024 * 1024;   // 10 MiB
constexpr int DEFAULT_COMMAND_TIMEOUT_SECS   = 30;
constexpr int MAX_COMMAND_TIMEOUT_SECS       = 300;
constexpr int DEFAULT_MAX_COMMAND_LENGTH     = 10000;
constexpr int DEFAULT_MAX_PATH_LENGTH        = 4096;

// ── SSH ─────────────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT               = 22;
constexpr const char* DEFAULT_SSH_USERNAME   = "root";
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS   = 30;
constexpr int SSH_KEEPALIVE_INTERVAL_SECS    = 30;
constexpr int SSH_POLL_INTERVAL_MS           = 10;
constexpr int SSH_READ_BUF_SIZE              = 16384;
constexpr int SSH_CLOSE_GRACE_MS             = 250;    // Channel teardown budget after a timeout
constexpr int SESSION_MAX_RECONNECTS         = 1;      // Automatic reconnect-and-retry per call

// ── Transfers ───────────────────────────────────────────────
constexpr int DEFAULT_TRANSFER_TTL_SECS      = 3600;
constexpr int DEFAULT_INTERMEDIARY_TIMEOUT_SECS = 120;
constexpr unsigned DEFAULT_FILE_MODE         = 0644;
constexpr const char* DEFAULT_KEY_PREFIX     = "rexec";
constexpr const char* CLIENT_PATH_PLACEHOLDER = "<YOUR_FILE_PATH>";

// ── Containers ──────────────────────────────────────────────
constexpr int MIN_CONTAINER_ID               = 100;
constexpr int MAX_CONTAINER_ID               = 999999999;
constexpr int CONTAINER_OP_TIMEOUT_SECS      = 30;
constexpr const char* CONTAINER_TEMP_PREFIX  = "/tmp/rexec-";

// ── Logging ─────────────────────────────────────────────────
constexpr int LOG_EXCERPT_CHARS              = 500;
