#pragma once

#include <cstdint>

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 30;     // TCP connect + SSH handshake
constexpr int CHANNEL_OPEN_TIMEOUT_SECS  = 30;     // Opening a session channel
constexpr int ELEVATION_TIMEOUT_MS       = 10000;  // Whole su login exchange
constexpr int CHANNEL_READ_POLL_MS       = 500;    // Per-read wait; deadlines are re-checked between reads
constexpr int ABORT_TIMEOUT_MS           = 5000;   // Waiting for the pkill channel to finish
constexpr int CONNECT_WAIT_POLL_MS       = 100;    // Poll interval while another caller connects
constexpr int SOCKET_POLL_MS             = 10;     // Granularity of EAGAIN waits
constexpr int SSH_KEEPALIVE_SECS         = 30;

// ── Command defaults ────────────────────────────────────────
constexpr uint64_t DEFAULT_TIMEOUT_MS    = 60000;
constexpr uint64_t MAX_TIMEOUT_MS        = 7ULL * 24 * 3600 * 1000;  // One week
constexpr int DEFAULT_MAX_CHARS          = 1000;
constexpr int DEFAULT_SSH_PORT           = 22;

// ── Elevated shell ──────────────────────────────────────────
constexpr const char* PTY_TERM           = "xterm";
constexpr int PTY_COLS                   = 80;
constexpr int PTY_ROWS                   = 24;
constexpr const char* SU_COMMAND         = "su -\n";

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SSH_DRAIN_BUF_SIZE         = 4096;

// ── Abort ───────────────────────────────────────────────────
// Use fmt::format with the shell-escaped command
constexpr const char* ABORT_COMMAND_FMT  = "timeout 3s pkill -f '{}' 2>/dev/null || true";

constexpr const char* SSHBRIDGE_VERSION  = "0.1.0";
