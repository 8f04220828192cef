#pragma once

#include <string>

#include "tusclient/core.hpp"

namespace tusclient::creation {

/// Reserve an upload at the creation endpoint `url` (POST).
///
/// When `source` is given its length is sent as Upload-Length; when it is
/// null the header is left out (deferred length / final concatenation).
/// Upload-Metadata is only sent for a non-empty mapping. Returns the Location
/// header verbatim, which may be relative to `url`.
std::string create(net::HttpSession& session, const std::string& url,
                   ByteSource* source, const Metadata& metadata,
                   const RequestOptions& options = {});

}  // namespace tusclient::creation
