#pragma once

#include <cstddef>
#include <cstdint>

namespace davdrive::constants {

// Driver defaults
constexpr const char* DEFAULT_ROOT = "/";
constexpr const char* DEFAULT_AUTH_TYPE = "auto";

// Resumable-upload extensions advertised by the chunked upload emulator
constexpr const char* TUS_EXTENSION_CREATION = "creation";
constexpr const char* TUS_EXTENSION_TERMINATION = "termination";
constexpr const char* TUS_EXTENSION_EXPIRATION = "expiration";

// HTTP transport defaults
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECONDS = 10;
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_SECONDS = 60;
constexpr size_t DEFAULT_CONNECTION_POOL_SIZE = 10;
constexpr size_t DEFAULT_MAX_RESPONSE_SIZE = 1024ULL * 1024 * 1024;     // 1GB
constexpr const char* DEFAULT_USER_AGENT = "davdrive/1.0";

// Streaming
constexpr size_t DEFAULT_STREAM_BUFFER_SIZE = 64 * 1024;                // 64KB
constexpr size_t DEFAULT_UPLOAD_CHUNK_SIZE = 8 * 1024 * 1024;           // 8MB

// Keyed lock shards for serialized chunk writes
constexpr size_t CHUNK_LOCK_SHARDS = 64;

// Metrics
constexpr uint32_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace davdrive::constants
