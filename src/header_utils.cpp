#include "tusclient/header_utils.hpp"
#include "tusclient/error.hpp"

#include <charconv>

namespace tusclient {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

uint64_t parse_positive_integer_header(const net::HttpHeaders& headers,
                                       const std::string& name) {
    auto raw = headers.get(name);
    std::string value = raw ? trim(*raw) : std::string();

    auto fail = [&]() {
        return TusError::protocol_violation(
            "Unable to convert \"" + name + "\" header \"" + value +
                "\" to a positive integer.",
            name, value);
    };

    if (!raw || value.empty()) {
        throw fail();
    }

    // A leading '-' is rejected along with every other non-digit
    const char* first = value.data();
    const char* last = value.data() + value.size();
    if (*first == '+') ++first;
    if (first == last || *first < '0' || *first > '9') {
        throw fail();
    }

    uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc() || ptr != last) {
        throw fail();
    }
    return result;
}

std::vector<std::string> split_header_list(const std::string& value) {
    std::vector<std::string> result;
    size_t start = 0;
    while (true) {
        size_t comma = value.find(',', start);
        result.push_back(trim(value.substr(start, comma - start)));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return result;
}

}  // namespace tusclient
