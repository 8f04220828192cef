#pragma once

#include <chrono>
#include <cstddef>

namespace tusclient::constants {

// Protocol
constexpr const char* TUS_PROTOCOL_VERSION = "1.0.0";
constexpr const char* OFFSET_OCTET_STREAM = "application/offset+octet-stream";
constexpr const char* CONCATENATION_EXTENSION = "concatenation";

// Transfer defaults
constexpr size_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;  // 4MB
constexpr size_t DEFAULT_PARALLEL_UPLOADS = 3;

// Retry defaults
constexpr int DEFAULT_RETRY_ATTEMPTS = 10;
constexpr std::chrono::milliseconds DEFAULT_MAX_RETRY_PERIOD{60000};
constexpr std::chrono::milliseconds DEFAULT_INITIAL_RETRY_DELAY{1000};

// Granularity of cancellation checks while sleeping
constexpr std::chrono::milliseconds CANCELLATION_POLL_INTERVAL{50};

}  // namespace tusclient::constants
