#pragma once

#include <cstddef>
#include <cstdint>

namespace s3pane::constants {

constexpr uint64_t MiB = 1024ULL * 1024;

// Multipart sizing
constexpr uint64_t TARGET_PART_COUNT = 3000;
constexpr uint64_t MIN_PART_SIZE_MB = 8;
constexpr uint64_t MIN_AUTO_PART_SIZE_MB = 64;
constexpr uint64_t MAX_PART_SIZE_MB = 5120 - 8;  // just under the 5 GB single-part limit
constexpr size_t DEFAULT_UPLOAD_CONCURRENCY = 4;

// Transport defaults
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECS = 30;
constexpr uint32_t DEFAULT_READ_TIMEOUT_SECS = 7200;  // long uploads (2h+)
constexpr uint32_t DEFAULT_MAX_ATTEMPTS = 10;
constexpr uint32_t DEFAULT_RETRY_BASE_DELAY_MS = 100;
constexpr uint32_t MAX_RETRY_DELAY_MS = 20000;

// Listing
constexpr uint32_t DEFAULT_LIST_MAX_KEYS = 1000;
constexpr size_t DEFAULT_MAX_PENDING_PREFIXES = 100000;

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECS = 15;

}  // namespace s3pane::constants
