#pragma once

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS  = 30;    // TCP connect + handshake
constexpr int DEFAULT_KEEPALIVE_SECS        = 30;    // SSH keepalive interval
constexpr int SOCKET_WAIT_SLICE_MS          = 100;   // poll() slice while libssh2 says EAGAIN

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE             = 4096;

// ── Remote commands ─────────────────────────────────────────
constexpr const char* DIRECTORY_PROBE_COMMAND = "pwd";
constexpr const char* DEFAULT_TERMINAL_TYPE   = "xterm";

// ── Boundary messages ───────────────────────────────────────
constexpr const char* MSG_CONNECTED        = "Successfully connected and authenticated";
constexpr const char* MSG_NO_AUTH_METHOD   =
    "No authentication method provided (password or private_key_path required)";
constexpr const char* MSG_NOT_FOUND        = "Connection not found. Please connect first.";

// ── Version ─────────────────────────────────────────────────
constexpr const char* SSHDESK_VERSION      = "0.2.0";
