#include "tusclient/creation.hpp"
#include "tusclient/error.hpp"

namespace tusclient::creation {

std::string create(net::HttpSession& session, const std::string& url,
                   ByteSource* source, const Metadata& metadata,
                   const RequestOptions& options) {
    auto request = core::make_tus_request(net::HttpMethod::POST, url, options);

    if (source) {
        uint64_t total_size = source->seek(0, ByteSource::Whence::End);
        request.headers.set("Upload-Length", std::to_string(total_size));
    }

    // An empty header would be ambiguous, so leave it out entirely
    if (!metadata.empty()) {
        request.headers.set("Upload-Metadata", encode_metadata(metadata));
    }

    if (options.logger) options.logger->debug("Creating upload...");

    // Error statuses are transport failures; anything else but 201 is a
    // protocol violation and is not worth retrying.
    auto response = core::perform(session, request, options, /*accept_any_status=*/true);

    if (response.status_code != static_cast<int>(net::HttpStatus::Created)) {
        throw TusError::protocol_violation(
            "Wrong status code " + std::to_string(response.status_code) + ", expected 201.",
            "", "", response.status_code);
    }

    auto location = response.headers.get("Location");
    if (!location || location->empty()) {
        throw TusError::protocol_violation(
            "Upload created, but no \"Location\" header in response.",
            "Location", "", response.status_code);
    }

    return *location;
}

}  // namespace tusclient::creation
