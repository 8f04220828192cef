#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tusclient::net {

// HTTP methods used by the tus protocol (GET is used to read back uploads)
enum class HttpMethod {
    GET,
    HEAD,
    POST,
    PATCH,
    OPTIONS
};

const char* http_method_to_string(HttpMethod method);

// HTTP status codes the client cares about
enum class HttpStatus {
    OK = 200,
    Created = 201,
    MultipleChoices = 300,
    BadRequest = 400
};

bool is_success_status(int status);
bool is_error_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    HttpHeaders() = default;
    HttpHeaders(std::initializer_list<std::pair<std::string, std::string>> init);

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    bool empty() const { return headers_.empty(); }

    // Iteration (names are lowercase)
    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

// Return false to abort the transfer
using HttpProgressCallback = std::function<bool()>;

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Timeouts (0 = client default)
    std::chrono::milliseconds connect_timeout{0};
    std::chrono::milliseconds total_timeout{0};

    // Polled during the transfer
    HttpProgressCallback progress_callback;

    // SSL options
    bool verify_ssl = true;
    std::string ca_bundle_path;     // Empty = system default
    std::string pinned_public_key;  // "sha256//<base64>" or a PEM/DER path, empty = none

    static HttpRequest make(HttpMethod method, const std::string& url);
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

/// Anything that can carry out an HTTP exchange. Implementations must be safe
/// to call from several threads at once.
class HttpSession {
public:
    virtual ~HttpSession() = default;

    /// Never throws for transport failures; they are reported through
    /// HttpResponse::is_network_error.
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

// HTTP client configuration
// TUSCLIENT_REQUEST_TIMEOUT (seconds) overrides the default total timeout.
struct HttpClientConfig {
    // Connection pooling
    size_t max_total_connections = 32;

    // TCP keep-alive to prevent idle connections from being dropped by firewalls/LBs
    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    // Default timeouts
    std::chrono::milliseconds default_connect_timeout{30000};
    std::chrono::milliseconds default_total_timeout{300000};

    // Response size limits (0 = unlimited)
    size_t max_response_size = 16 * 1024 * 1024;

    std::string user_agent = "tusclient/1.0";
};

// libcurl-backed session with a pool of reusable easy handles
class HttpClient : public HttpSession {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    // Non-copyable, movable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    HttpResponse execute(const HttpRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
    std::string scheme;   // http, https
    std::string host;
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;
    std::string fragment;
    std::string userinfo; // user:password

    std::string to_string() const;

    /// scheme://[userinfo@]host[:port]
    std::string origin() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

/// Resolve a possibly relative `reference` (e.g. a Location header) against
/// `base`. Absolute references are returned unchanged. Dot segments ("./",
/// "../") are passed through, not removed. Throws std::invalid_argument if
/// `base` is not an absolute URL.
std::string resolve_url(const std::string& base, const std::string& reference);

/// Path component of an absolute URL, or the reference itself if relative.
std::string url_path(const std::string& url);

}  // namespace tusclient::net
