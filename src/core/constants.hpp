#pragma once

#include <cstddef>

// ── Connection defaults ─────────────────────────────────────
constexpr int DEFAULT_SSH_PORT             = 22;
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS = 30;
constexpr int DEFAULT_MAX_PARALLEL         = 10;
constexpr int DEFAULT_BANNER_TIMEOUT_SECS  = 240;
constexpr int DEFAULT_KEEP_ALIVE_SECS      = 30;
constexpr int DEFAULT_POOL_SIZE            = 50;
constexpr int DEFAULT_IDLE_TIMEOUT_SECS    = 300;
constexpr int DEFAULT_MAX_RETRIES          = 3;
constexpr double DEFAULT_RETRY_DELAY_SECS  = 1.0;
constexpr double MAX_RETRY_DELAY_SECS      = 30.0;   // backoff cap
constexpr int REAPER_MAX_INTERVAL_SECS     = 30;

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CMD_TIMEOUT_SECS         = 300;   // Max time for a single SSH command
constexpr int SSH_OPEN_TIMEOUT_SECS        = 30;    // Opening a channel or SFTP handle
constexpr int PING_TIMEOUT_SECS            = 5;     // Pool liveness probe
constexpr int DEFAULT_INTERACTIVE_TIMEOUT_SECS = 60;
constexpr int SHELL_SETTLE_MS              = 100;   // Pause between chained commands

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE            = 4096;
constexpr int SSH_DRAIN_BUF_SIZE           = 4096;
constexpr int TUNNEL_BUF_SIZE              = 16384;

// ── Log capture defaults ────────────────────────────────────
constexpr std::size_t DEFAULT_CAPTURE_BUFFER_BYTES = 8192;
constexpr double DEFAULT_CAPTURE_FLUSH_SECS        = 1.0;
constexpr std::size_t DEFAULT_CAPTURE_MAX_FILE     = 10 * 1024 * 1024;
constexpr int DEFAULT_CAPTURE_ROTATIONS            = 5;
constexpr int CAPTURE_POLL_MS                      = 250;
constexpr std::size_t DEFAULT_RECENT_LOG_ENTRIES   = 8192;   // parsed entries kept for queries

// ── File transfer defaults ──────────────────────────────────
constexpr std::size_t DEFAULT_TRANSFER_CHUNK = 32768;

// ── Traffic defaults ────────────────────────────────────────
constexpr double DEFAULT_PROBE_DURATION_SECS = 60.0;
constexpr double DEFAULT_PROBE_INTERVAL_SECS = 1.0;
constexpr int DEFAULT_PROBE_TIMEOUT_SECS     = 5;
constexpr int DEFAULT_PACKET_SIZE            = 1024;

// ── iperf3 defaults ─────────────────────────────────────────
constexpr int DEFAULT_IPERF_PORT             = 5201;
constexpr int DEFAULT_IPERF_DURATION_SECS    = 10;
constexpr int DEFAULT_IPERF_STREAMS          = 1;
constexpr int DEFAULT_IPERF_MSS              = 1460;
constexpr int DEFAULT_IPERF_INTERVAL_SECS    = 2;
constexpr double DEFAULT_IPERF_TOLERANCE_PCT = 10.0;
constexpr int IPERF_SERVER_SETTLE_MS         = 500;   // between daemon start and client

