#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tusclient/http.hpp"

namespace tusclient {

/// Read a header holding a non-negative integer (Upload-Offset, Tus-Max-Size).
/// Throws TusError(ErrorKind::ProtocolViolation) if the header is missing,
/// not a number, negative or out of range.
uint64_t parse_positive_integer_header(const net::HttpHeaders& headers,
                                       const std::string& name);

/// Split a comma-separated header value, trimming whitespace around elements.
std::vector<std::string> split_header_list(const std::string& value);

/// Strip leading and trailing spaces and tabs.
std::string trim(const std::string& s);

}  // namespace tusclient
