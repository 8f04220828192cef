#include "tusclient/core.hpp"
#include "tusclient/error.hpp"
#include "tusclient/header_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace tusclient {

bool ServerConfiguration::supports(const std::string& extension) const {
    return std::find(protocol_extensions.begin(), protocol_extensions.end(), extension) !=
           protocol_extensions.end();
}

namespace core {

namespace {

template <typename... Args>
void log_debug(const RequestOptions& options, const char* fmt, Args... args) {
    if (options.logger) options.logger->debug(fmt, args...);
}

}  // namespace

net::HttpRequest make_tus_request(net::HttpMethod method, const std::string& url,
                                  const RequestOptions& options) {
    auto request = net::HttpRequest::make(method, url);
    request.headers = options.headers;
    request.headers.set("Tus-Resumable", constants::TUS_PROTOCOL_VERSION);
    options.tls.apply(request);

    // Lets a blocked transfer notice cancellation
    CancellationToken cancel = options.cancel;
    request.progress_callback = [cancel]() { return !cancel.is_cancelled(); };
    return request;
}

net::HttpResponse perform(net::HttpSession& session, const net::HttpRequest& request,
                          const RequestOptions& options, bool accept_any_status) {
    options.cancel.throw_if_cancelled();

    auto response = session.execute(request);

    // An aborted transfer shows up as a network error; report it as what it is
    options.cancel.throw_if_cancelled();

    const char* method = net::http_method_to_string(request.method);
    if (response.is_network_error) {
        throw TusError::transport(std::string(method) + " " + request.url +
                                  " failed: " + response.error);
    }

    bool failed = accept_any_status ? net::is_error_status(response.status_code)
                                    : !response.ok();
    if (failed) {
        throw TusError::transport(std::string(method) + " " + request.url +
                                      " returned HTTP " + std::to_string(response.status_code),
                                  response.status_code);
    }
    return response;
}

uint64_t offset(net::HttpSession& session, const std::string& location,
                const RequestOptions& options) {
    log_debug(options, "Getting offset of \"%s\"...", location.c_str());
    auto request = make_tus_request(net::HttpMethod::HEAD, location, options);
    auto response = perform(session, request, options);

    if (!response.headers.has("Upload-Offset")) {
        throw TusError::protocol_violation(
            "HEAD request succeeded for " + location +
                ", but no \"Upload-Offset\" header in response.",
            "Upload-Offset", "", response.status_code);
    }
    return parse_positive_integer_header(response.headers, "Upload-Offset");
}

Metadata metadata(net::HttpSession& session, const std::string& location,
                  const RequestOptions& options) {
    log_debug(options, "Getting metadata of \"%s\"...", location.c_str());
    auto request = make_tus_request(net::HttpMethod::HEAD, location, options);
    auto response = perform(session, request, options);

    auto header = response.headers.get("Upload-Metadata");
    if (!header) {
        return {};
    }

    try {
        return decode_metadata(*header);
    } catch (const TusError& e) {
        throw TusError::protocol_violation(
            std::string("Unable to parse metadata: ") + e.what(),
            "Upload-Metadata", *header, response.status_code);
    }
}

namespace {

enum class TransferState {
    Discovering,  // Server offset unknown
    Reconciling,  // Compare server offset with the local size
    Seeking,      // Move the read cursor to the server offset
    Sending,      // PATCH one chunk
    Done
};

}  // namespace

void upload_buffer(net::HttpSession& session, const std::string& location,
                   ByteSource& source, const RequestOptions& options, size_t chunksize) {
    if (chunksize == 0) {
        throw std::invalid_argument("chunksize must be > 0");
    }

    const uint64_t total_size = source.seek(0, ByteSource::Whence::End);

    uint64_t server_offset = 0;
    // Where the next read() will start; unknown right after measuring the size
    std::optional<uint64_t> read_offset;

    TransferState state = TransferState::Discovering;
    while (state != TransferState::Done) {
        switch (state) {
            case TransferState::Discovering:
                // Asking first makes this usable for resuming interrupted uploads
                server_offset = offset(session, location, options);
                log_debug(options, "Resuming upload of \"%s\" at offset %llu...",
                          location.c_str(), static_cast<unsigned long long>(server_offset));
                state = TransferState::Reconciling;
                break;

            case TransferState::Reconciling:
                if (server_offset == total_size) {
                    if (options.logger) options.logger->info("Complete buffer uploaded.");
                    state = TransferState::Done;
                } else if (server_offset > total_size) {
                    throw TusError::protocol_violation(
                        "Server offset " + std::to_string(server_offset) +
                            " exceeds local size " + std::to_string(total_size) + ".",
                        "Upload-Offset", std::to_string(server_offset));
                } else if (read_offset != server_offset) {
                    state = TransferState::Seeking;
                } else {
                    state = TransferState::Sending;
                }
                break;

            case TransferState::Seeking:
                read_offset = source.seek(static_cast<int64_t>(server_offset),
                                          ByteSource::Whence::Begin);
                state = TransferState::Sending;
                break;

            case TransferState::Sending: {
                auto chunk = source.read(chunksize);
                if (chunk.empty()) {
                    // The size was measured up front, so the source shrank
                    throw TusError::unexpected_eof(
                        "Buffer returned unexpected EOF at offset " +
                        std::to_string(server_offset) + ".");
                }
                *read_offset += chunk.size();

                log_debug(options, "Uploading %zu bytes to \"%s\"...", chunk.size(),
                          location.c_str());
                auto request = make_tus_request(net::HttpMethod::PATCH, location, options);
                request.headers.set("Upload-Offset", std::to_string(server_offset));
                request.headers.set("Content-Length", std::to_string(chunk.size()));
                request.headers.set("Content-Type", constants::OFFSET_OCTET_STREAM);
                request.body = std::move(chunk);

                auto response = perform(session, request, options);

                // Trust the server's count, not our own arithmetic
                server_offset = parse_positive_integer_header(response.headers, "Upload-Offset");
                state = TransferState::Reconciling;
                break;
            }

            case TransferState::Done:
                break;
        }
    }
}

ServerConfiguration configuration(net::HttpSession& session, const std::string& url,
                                  const RequestOptions& options) {
    log_debug(options, "Querying server configuration...");
    auto request = make_tus_request(net::HttpMethod::OPTIONS, url, options);
    auto response = perform(session, request, options);

    auto versions = response.headers.get("Tus-Version");
    if (!versions) {
        throw TusError::protocol_violation("\"Tus-Version\" header not present.",
                                           "Tus-Version", "", response.status_code);
    }

    ServerConfiguration config;
    config.protocol_versions = split_header_list(*versions);

    if (response.headers.has("Tus-Max-Size")) {
        config.max_size = parse_positive_integer_header(response.headers, "Tus-Max-Size");
    }

    if (auto extensions = response.headers.get("Tus-Extension")) {
        config.protocol_extensions = split_header_list(*extensions);
    }

    return config;
}

}  // namespace core
}  // namespace tusclient
