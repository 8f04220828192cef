#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tusclient/constants.hpp"
#include "tusclient/http.hpp"
#include "tusclient/metadata.hpp"
#include "tusclient/retry.hpp"

namespace tusclient {

/// Configuration for the tus-upload command line tool.
struct ClientConfig {
    // "upload", "upload-multiple" or "metadata"
    std::string command;

    // Creation endpoint (upload commands) or upload location (metadata)
    std::string url;
    std::vector<std::filesystem::path> files;

    // --metadata key[=value], applied on top of the defaults derived from the file
    Metadata metadata;
    net::HttpHeaders headers;

    // Retry policy
    int retry_attempts = constants::DEFAULT_RETRY_ATTEMPTS;
    std::chrono::milliseconds max_retry_period = constants::DEFAULT_MAX_RETRY_PERIOD;
    std::chrono::milliseconds initial_retry_delay = constants::DEFAULT_INITIAL_RETRY_DELAY;

    // Transfer
    size_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    size_t parallel_uploads = constants::DEFAULT_PARALLEL_UPLOADS;

    // TLS
    bool verify_ssl = true;
    std::string ca_cert_path;
    std::string pinned_public_key;  // sha256//<base64>
    std::filesystem::path pin_cert_path;  // PEM certificate whose key is pinned

    // Output
    bool debug = false;
    std::filesystem::path metrics_file;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<ClientConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// Build the retry policy (resolves --pin-cert through OpenSSL).
    RetryConfiguration retry_config() const;
};

/// Parse one --metadata argument ("key" or "key=value") into `metadata`.
void parse_metadata_arg(const std::string& arg, Metadata& metadata);

/// Parse one --header argument ("Name: value"). Returns false if malformed.
bool parse_header_arg(const std::string& arg, net::HttpHeaders& headers);

}  // namespace tusclient
