#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
using namespace std::chrono_literals;

// --- Retry Controller ---
inline constexpr std::uint32_t             DEFAULT_RETRY_COUNT   = 3;  // 4 tries in total
inline constexpr std::chrono::milliseconds DEFAULT_RETRY_SPACING = 2s;
inline constexpr std::chrono::milliseconds MAX_RETRY_SPACING     = 30s;  // 429 backoff cap
inline constexpr std::uint32_t             MAX_RETRY_COUNT       = 20;

// --- Chunked transport ---
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;
inline constexpr std::size_t MIN_CHUNK_SIZE     = 1024;
inline constexpr std::size_t MAX_CHUNK_SIZE     = 2 * 1024 * 1024;

// Passed through to the HTTP client verbatim.
inline constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT     = 5s;
inline constexpr std::chrono::seconds      DEFAULT_POOL_IDLE_TIMEOUT   = 90s;
inline constexpr std::size_t               DEFAULT_POOL_MAX_IDLE       = 2;
inline constexpr std::size_t               MAX_ERROR_BODY              = 4096;
inline constexpr std::size_t               MAX_RESPONSE_BODY           = 256 * 1024;

// --- Progress & stall monitor ---
inline constexpr std::chrono::milliseconds DEFAULT_TICK_INTERVAL = 100ms;
inline constexpr std::uint32_t             DEFAULT_STALL_TICKS   = 200;  // 20 s at 100 ms
// body fully handed over, still no answer from the host
inline constexpr std::chrono::milliseconds DEFAULT_RESPONSE_TIMEOUT = 300s;

// --- Attachments ---
inline constexpr std::string_view DEFAULT_MIME      = "application/octet-stream";
inline constexpr std::string_view DEFAULT_EXTENSION = "bin";
inline constexpr std::string_view ALGORITHM_NAME    = "aes-gcm";

// --- Environment ---
inline constexpr const char *ENV_SERVERS           = "SEALDROP_SERVERS";
inline constexpr const char *ENV_NIP96_SERVERS     = "SEALDROP_NIP96_SERVERS";
inline constexpr const char *ENV_AUTH              = "SEALDROP_AUTH";
inline constexpr const char *ENV_RETRY_COUNT       = "SEALDROP_RETRY_COUNT";
inline constexpr const char *ENV_RETRY_SPACING_MS  = "SEALDROP_RETRY_SPACING_MS";
inline constexpr const char *ENV_CHUNK_SIZE        = "SEALDROP_CHUNK_SIZE";
inline constexpr const char *ENV_CONNECT_TIMEOUT   = "SEALDROP_CONNECT_TIMEOUT_MS";
inline constexpr const char *ENV_POOL_IDLE_TIMEOUT = "SEALDROP_POOL_IDLE_TIMEOUT_S";
inline constexpr const char *ENV_POOL_MAX_IDLE     = "SEALDROP_POOL_MAX_IDLE";
inline constexpr const char *ENV_STALL_TICKS       = "SEALDROP_STALL_TICKS";
inline constexpr const char *ENV_RESPONSE_TIMEOUT  = "SEALDROP_RESPONSE_TIMEOUT_MS";
inline constexpr const char *ENV_PROXY             = "SEALDROP_PROXY";
inline constexpr const char *ENV_LOG_LEVEL         = "SEALDROP_LOG_LEVEL";

}  // namespace constants
