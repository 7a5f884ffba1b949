#pragma once

#include <cstddef>
#include <cstdint>

// ── API paths ───────────────────────────────────────────────
constexpr const char* DEFAULT_BASE_PATH     = "/api/v2/";
constexpr const char* PLAN_PATH             = "plans/{}";
constexpr const char* PLAN_JSON_OUTPUT_PATH = "plans/{}/json-output";
constexpr const char* PLAN_JSON_REDACTED_PATH = "plans/{}/json-output-redacted";
constexpr const char* HTTP_USER_AGENT       = "planlog/0.1";

// ── Log polling ─────────────────────────────────────────────
constexpr int LOG_POLL_MIN_MS            = 500;   // First backoff step between empty fetches
constexpr int LOG_POLL_MAX_MS            = 2000;  // Backoff ceiling
constexpr int LOG_POLL_BACKOFF_DIVISOR   = 5;     // Backoff doubles every N polls
constexpr int CANCEL_CHECK_SLICE_MS      = 100;   // Granularity for cancellable waits

// ── Log framing ─────────────────────────────────────────────
constexpr char LOG_STX = '\x02';   // Start of text
constexpr char LOG_ETX = '\x03';   // End of text

// ── Timeouts ────────────────────────────────────────────────
constexpr int HTTP_CONNECT_TIMEOUT_SECS  = 10;
constexpr int HTTP_REQUEST_TIMEOUT_SECS  = 30;

// ── Buffer sizes ────────────────────────────────────────────
constexpr std::size_t LOG_CHUNK_SIZE     = 65536;
constexpr std::size_t HTTP_MAX_HEADER_BYTES = 64 * 1024;
constexpr std::uint64_t HTTP_MAX_BODY_BYTES = 64ULL * 1024 * 1024;  // json-output can be large

// ── Local files ─────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME    = ".planlog";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* DEBUG_LOG_NAME     = "planlog_debug.log";
