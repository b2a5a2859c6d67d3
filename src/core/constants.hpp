#pragma once

// ── File names ──────────────────────────────────────────────
// Run files and lock live beside the configuration file.
constexpr const char* CONFIG_FILE_NAME  = "chanhub.yaml";
constexpr const char* PID_FILE_NAME     = "chanhub.pid";
constexpr const char* PORT_FILE_NAME    = "chanhub.port";
constexpr const char* LOCK_FILE_NAME    = "chanhub.lock";
constexpr const char* LOG_FILE_NAME     = "chanhub.log";

// ── Timeouts / intervals ────────────────────────────────────
constexpr int SSH_POLL_MS                = 10;    // EAGAIN retry interval for libssh2 calls
constexpr int SSH_CHANNEL_OPEN_SECS      = 30;    // Deadline for opening one channel
constexpr int SSH_KEEPALIVE_SECS         = 30;    // libssh2 keepalive interval
constexpr int CYCLE_PAUSE_MS             = 1000;  // Pause between supervision cycles
constexpr int ACCEPT_POLL_MS             = 500;   // Listener poll interval (local forward)
constexpr int ALIVE_CHECK_SECS           = 15;    // Session liveness probe while idle
constexpr int SESSION_TICK_MS            = 1000;  // Session duty loop tick
constexpr int RELAY_POLL_MS              = 20;    // Relay readiness poll
constexpr int LOCAL_CONNECT_MS           = 5000;  // Remote forward -> local destination
constexpr int FIRST_ATTEMPT_WAIT_SECS    = 60;    // Orchestrator wait for first attempt

// ── Control plane ───────────────────────────────────────────
constexpr int CONTROL_ACCEPT_POLL_MS     = 200;   // Bounds stop → run-file removal latency
constexpr int CONTROL_IO_TIMEOUT_MS      = 5000;  // Per-connection read/write budget
constexpr int CONTROL_MAX_LINE           = 256;
constexpr int DAEMON_SPAWN_WAIT_MS       = 800;
constexpr int STOP_SETTLE_MS             = 600;
constexpr int PORT_TEST_TIMEOUT_MS       = 2000;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int RELAY_BUF_SIZE             = 16384;
constexpr int SSH_DRAIN_BUF_SIZE         = 4096;

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_LOOPBACK   = "127.0.0.1";
constexpr const char* REMOTE_BIND_ADDRESS = "localhost";  // -R binds loopback on the server
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr const char* PASSWORD_PLACEHOLDER = "CHANGE_ME";
constexpr const char* CHANHUB_VERSION    = "0.4.0";
