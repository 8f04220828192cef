#pragma once

#include <stdexcept>
#include <string>

namespace tusclient {

/// Closed set of failure categories raised by the protocol layer.
enum class ErrorKind {
    Transport,             // connection/TLS failure or unexpected HTTP status; retryable
    ProtocolViolation,     // well-formed response that breaks tus rules
    MetadataDecode,        // Upload-Metadata value does not follow the grammar
    InvalidKey,            // metadata key is non-ASCII or contains ' ' or ','
    UnsupportedExtension,  // server lacks a required extension
    UnexpectedEof,         // byte source shrank during the transfer
    Cancelled,             // caller requested cancellation
};

const char* error_kind_to_string(ErrorKind kind);

/// Typed protocol error. The structured fields describe what was observed so
/// callers can branch on kind() instead of parsing what().
class TusError : public std::runtime_error {
public:
    TusError(ErrorKind kind, const std::string& message,
             std::string header = {}, std::string value = {}, int status_code = 0);

    ErrorKind kind() const noexcept { return kind_; }

    /// Name of the offending header, metadata key or extension (may be empty).
    const std::string& header() const noexcept { return header_; }

    /// Observed value that triggered the error (may be empty).
    const std::string& value() const noexcept { return value_; }

    /// HTTP status of the response, 0 when no response was received.
    int status_code() const noexcept { return status_code_; }

    /// Only transport failures are worth another attempt.
    bool retryable() const noexcept { return kind_ == ErrorKind::Transport; }

    // Factories
    static TusError transport(const std::string& message, int status_code = 0);
    static TusError protocol_violation(const std::string& message,
                                       const std::string& header = {},
                                       const std::string& value = {},
                                       int status_code = 0);
    static TusError metadata_decode(const std::string& message, const std::string& token);
    static TusError invalid_key(const std::string& message, const std::string& key);
    static TusError unsupported_extension(const std::string& extension);
    static TusError unexpected_eof(const std::string& message);

private:
    ErrorKind kind_;
    std::string header_;
    std::string value_;
    int status_code_;
};

/// Raised when a CancellationToken fires. Never converted into a failed result.
class UploadCancelled : public TusError {
public:
    UploadCancelled();
};

}  // namespace tusclient
