#include "tusclient/metadata.hpp"
#include "tusclient/error.hpp"
#include "tusclient/header_utils.hpp"

#include <array>
#include <cctype>
#include <sstream>

namespace tusclient {

namespace {

const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

const std::array<int, 256>& decode_table() {
    static const std::array<int, 256> table = [] {
        std::array<int, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 64; ++i) {
            t[static_cast<unsigned char>(base64_chars[i])] = i;
        }
        return t;
    }();
    return table;
}

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_blank(s[i])) ++i;
        size_t start = i;
        while (i < s.size() && !is_blank(s[i])) ++i;
        if (i > start) tokens.push_back(s.substr(start, i - start));
    }
    return tokens;
}

}  // namespace

std::string base64_encode(const uint8_t* data, size_t size) {
    std::string result;
    result.reserve((size + 2) / 3 * 4);

    size_t i = 0;
    while (i < size) {
        uint32_t octet_a = i < size ? data[i++] : 0;
        uint32_t octet_b = i < size ? data[i++] : 0;
        uint32_t octet_c = i < size ? data[i++] : 0;

        uint32_t triple = (octet_a << 16) + (octet_b << 8) + octet_c;

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += (i > size + 1) ? '=' : base64_chars[(triple >> 6) & 0x3F];
        result += (i > size) ? '=' : base64_chars[triple & 0x3F];
    }

    return result;
}

std::string base64_encode(const Bytes& data) {
    return base64_encode(data.data(), data.size());
}

std::optional<Bytes> base64_decode_strict(const std::string& encoded) {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    if (!encoded.empty() && encoded.back() == '=') ++padding;
    if (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') ++padding;

    const auto& table = decode_table();
    Bytes result;
    result.reserve(encoded.size() / 4 * 3);

    uint32_t val = 0;
    int bits = 0;
    size_t data_chars = encoded.size() - padding;

    for (size_t i = 0; i < data_chars; ++i) {
        int d = table[static_cast<unsigned char>(encoded[i])];
        if (d < 0) {
            return std::nullopt;  // Outside the alphabet, or '=' before the end
        }
        val = (val << 6) | static_cast<uint32_t>(d);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((val >> bits) & 0xFF));
        }
    }

    return result;
}

void check_metadata_keys(const Metadata& metadata) {
    for (const auto& [key, value] : metadata) {
        for (unsigned char c : key) {
            if (c > 0x7F) {
                throw TusError::invalid_key(
                    "Metadata keys must only contain ASCII characters.", key);
            }
        }
        if (key.find(' ') != std::string::npos) {
            throw TusError::invalid_key("Metadata keys must not contain spaces.", key);
        }
        if (key.find(',') != std::string::npos) {
            throw TusError::invalid_key("Metadata keys must not contain commas.", key);
        }
    }
}

std::string encode_metadata(const Metadata& metadata) {
    check_metadata_keys(metadata);

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : metadata) {
        if (!first) oss << ",";
        first = false;

        oss << key;
        if (value) {
            oss << " " << base64_encode(*value);
        }
    }
    return oss.str();
}

Metadata decode_metadata(const std::string& header) {
    Metadata md;

    if (trim(header).empty()) {
        return md;
    }

    std::istringstream iss(header);
    std::string pair;
    while (std::getline(iss, pair, ',')) {
        auto kv = split_whitespace(pair);
        if (kv.size() == 1) {
            // "key" has no value, "key " has an empty one
            size_t key_end = pair.find(kv[0]) + kv[0].size();
            if (key_end < pair.size()) {
                md[kv[0]] = Bytes{};
            } else {
                md[kv[0]] = std::nullopt;
            }
        } else if (kv.size() == 2) {
            auto decoded = base64_decode_strict(kv[1]);
            if (!decoded) {
                throw TusError::metadata_decode(
                    "Invalid base64 value for key \"" + kv[0] + "\".", kv[1]);
            }
            md[kv[0]] = std::move(*decoded);
        } else if (kv.empty()) {
            throw TusError::metadata_decode("Empty key/value pair.", pair);
        } else {
            throw TusError::metadata_decode(
                "Key/Value pair consists of more than two elements.", pair);
        }
    }

    // getline drops a final empty field after a trailing comma
    if (header.back() == ',') {
        throw TusError::metadata_decode("Empty key/value pair.", "");
    }

    return md;
}

}  // namespace tusclient
