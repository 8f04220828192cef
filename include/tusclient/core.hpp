#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tusclient/byte_source.hpp"
#include "tusclient/cancellation.hpp"
#include "tusclient/constants.hpp"
#include "tusclient/http.hpp"
#include "tusclient/logging.hpp"
#include "tusclient/metadata.hpp"
#include "tusclient/tls.hpp"

namespace tusclient {

/// Per-request settings shared by every protocol operation.
struct RequestOptions {
    net::HttpHeaders headers;  // Passed through verbatim on every request
    TlsVerification tls;
    CancellationToken cancel;
    Logger* logger = nullptr;  // Borrowed; protocol steps are logged at debug level
};

/// Server capabilities reported by one OPTIONS response.
struct ServerConfiguration {
    /// Supported protocol versions, in the server's order of preference.
    std::vector<std::string> protocol_versions;

    /// Maximum upload size in bytes, if the server reports one.
    std::optional<uint64_t> max_size;

    /// Supported extensions, in the order the server listed them.
    std::vector<std::string> protocol_extensions;

    bool supports(const std::string& extension) const;
};

namespace core {

/// Number of bytes the server holds for the upload at `location` (HEAD).
uint64_t offset(net::HttpSession& session, const std::string& location,
                const RequestOptions& options = {});

/// Metadata stored with the upload at `location` (HEAD). A missing
/// Upload-Metadata header yields an empty mapping.
Metadata metadata(net::HttpSession& session, const std::string& location,
                  const RequestOptions& options = {});

/// Send the contents of `source` to `location`, resuming at whatever offset
/// the server reports. Every PATCH response's Upload-Offset is taken as the
/// new position, so bytes the server did not keep are sent again.
void upload_buffer(net::HttpSession& session, const std::string& location,
                   ByteSource& source, const RequestOptions& options = {},
                   size_t chunksize = constants::DEFAULT_CHUNK_SIZE);

/// Query the server's configuration at the creation endpoint `url` (OPTIONS).
ServerConfiguration configuration(net::HttpSession& session, const std::string& url,
                                  const RequestOptions& options = {});

/// Build a request carrying Tus-Resumable, the caller's headers and TLS mode.
net::HttpRequest make_tus_request(net::HttpMethod method, const std::string& url,
                                  const RequestOptions& options);

/// Run a request, converting cancellation and transport failures into
/// exceptions. Non-2xx statuses raise ErrorKind::Transport unless
/// `accept_any_status` is set (then only >= 400 does).
net::HttpResponse perform(net::HttpSession& session, const net::HttpRequest& request,
                          const RequestOptions& options, bool accept_any_status = false);

}  // namespace core
}  // namespace tusclient
