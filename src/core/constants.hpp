#pragma once

#include <cstddef>

// ── Job lifecycle ───────────────────────────────────────────
constexpr std::size_t HISTORY_CAPACITY = 2500;   // Recent lines kept in memory per job
constexpr int LAUNCH_FAILED_RC         = 127;    // Return code when no process could be started
constexpr int SIGNAL_RC_BASE           = 128;    // rc = 128 + signo for signal deaths

// ── Streaming ───────────────────────────────────────────────
constexpr int STREAM_POLL_MS           = 350;    // Max wait between viewer updates
constexpr int ACCEPT_POLL_MS           = 200;    // Accept loop wakeup for responsive shutdown

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PIPE_READ_BUF_SIZE       = 4096;
constexpr int SOCKET_READ_BUF_SIZE     = 4096;
constexpr std::size_t MAX_REQUEST_LINE = 64 * 1024;
constexpr std::size_t MAX_OUTPUT_LINE  = 64 * 1024;   // longer script output is cut into pieces

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_CONFIG_FILE = "jobcast.yaml";
constexpr const char* DEFAULT_SCRIPTS_DIR = "scripts";
constexpr const char* DEFAULT_LOGS_DIR    = "logs";
constexpr const char* DEFAULT_REPOS_DIR   = "repos";
constexpr const char* JOBCAST_VERSION     = "0.1.0";
