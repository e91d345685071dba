#pragma once

#include <cstddef>
#include <cstdint>

namespace storekit::constants {

// Object store defaults
constexpr size_t LIST_MAX_KEYS = 1000;            // Entries per listing response
constexpr const char* DEFAULT_REGION = "us-east-1";
constexpr const char* SIGNING_SERVICE = "s3";

// Environment variables read by EnvironmentCredentialSource
constexpr const char* ENV_ACCESS_KEY_ID = "AWS_ACCESS_KEY_ID";
constexpr const char* ENV_SECRET_ACCESS_KEY = "AWS_SECRET_ACCESS_KEY";

// Transport defaults
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECONDS = 30;
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_SECONDS = 0;     // No limit

// Chunk size for streaming object copies
constexpr size_t DEFAULT_COPY_BUFFER_SIZE = 64 * 1024;      // 64KB

// Metrics
constexpr uint32_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace storekit::constants
