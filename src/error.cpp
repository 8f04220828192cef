#include "tusclient/error.hpp"

#include <utility>

namespace tusclient {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transport: return "transport";
        case ErrorKind::ProtocolViolation: return "protocol violation";
        case ErrorKind::MetadataDecode: return "metadata decode";
        case ErrorKind::InvalidKey: return "invalid key";
        case ErrorKind::UnsupportedExtension: return "unsupported extension";
        case ErrorKind::UnexpectedEof: return "unexpected EOF";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

TusError::TusError(ErrorKind kind, const std::string& message,
                   std::string header, std::string value, int status_code)
    : std::runtime_error(message)
    , kind_(kind)
    , header_(std::move(header))
    , value_(std::move(value))
    , status_code_(status_code) {}

TusError TusError::transport(const std::string& message, int status_code) {
    return TusError(ErrorKind::Transport, message, {}, {}, status_code);
}

TusError TusError::protocol_violation(const std::string& message, const std::string& header,
                                      const std::string& value, int status_code) {
    return TusError(ErrorKind::ProtocolViolation, message, header, value, status_code);
}

TusError TusError::metadata_decode(const std::string& message, const std::string& token) {
    return TusError(ErrorKind::MetadataDecode, message, {}, token);
}

TusError TusError::invalid_key(const std::string& message, const std::string& key) {
    return TusError(ErrorKind::InvalidKey, message, key);
}

TusError TusError::unsupported_extension(const std::string& extension) {
    return TusError(ErrorKind::UnsupportedExtension,
                    "Server does not support the \"" + extension + "\" extension.",
                    extension);
}

TusError TusError::unexpected_eof(const std::string& message) {
    return TusError(ErrorKind::UnexpectedEof, message);
}

UploadCancelled::UploadCancelled()
    : TusError(ErrorKind::Cancelled, "Operation cancelled.") {}

}  // namespace tusclient
