#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tusclient {

using Bytes = std::vector<uint8_t>;

/// Upload metadata. std::nullopt marks a key that is present without a value,
/// which is distinct from a key with an empty value.
using Metadata = std::map<std::string, std::optional<Bytes>>;

inline Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

/// Reject keys that are non-ASCII or contain a space or a comma.
/// Throws TusError(ErrorKind::InvalidKey).
void check_metadata_keys(const Metadata& metadata);

/// Serialize to the Upload-Metadata header value ("key b64,key,...").
/// All keys are validated before anything is encoded.
std::string encode_metadata(const Metadata& metadata);

/// Parse an Upload-Metadata header value. An empty or blank header yields an
/// empty mapping. A key followed by whitespace but no value decodes to an
/// empty value, a bare key to std::nullopt.
/// Throws TusError(ErrorKind::MetadataDecode).
Metadata decode_metadata(const std::string& header);

std::string base64_encode(const uint8_t* data, size_t size);
std::string base64_encode(const Bytes& data);

/// Decode standard base64 with mandatory padding. Rejects characters outside
/// the alphabet (including whitespace) and misplaced or missing '='.
std::optional<Bytes> base64_decode_strict(const std::string& encoded);

}  // namespace tusclient
