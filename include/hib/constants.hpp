#pragma once

#include <cstddef>
#include <cstdint>

namespace hib::constants {

// Transfer defaults
constexpr size_t DEFAULT_TRANSFER_WIDTH = 5;
constexpr uint32_t DEFAULT_MAX_ATTEMPTS = 3;
constexpr uint32_t DEFAULT_TIMEOUT_SECONDS = 30;
constexpr uint32_t DEFAULT_BACKOFF_INITIAL_MS = 500;
constexpr uint32_t DEFAULT_BACKOFF_CEILING_MS = 30000;

// Listing
constexpr size_t DEFAULT_LIST_PAGE_SIZE = 100;
constexpr size_t MAX_PATH_COMPONENT = 255;

// HTTP
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECONDS = 10;
constexpr size_t DEFAULT_MAX_RESPONSE_SIZE = 256 * 1024 * 1024;  // 256MB
constexpr size_t DEFAULT_HTTP_POOL_SIZE = 16;

// Fingerprinting
constexpr size_t FINGERPRINT_READ_CHUNK = 64 * 1024;  // 64KB

// Metrics
constexpr uint32_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

// Paths
constexpr const char* DEFAULT_OUTPUT_DIR = "./backup";
constexpr const char* MANIFEST_FILE_NAME = "manifest.db";
constexpr const char* CONFIG_DIR_NAME = "hib";
constexpr const char* CONFIG_FILE_NAME = "config.json";

}  // namespace hib::constants
