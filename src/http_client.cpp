#include "tusclient/http.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace tusclient::net {

// ============================================================================
// Environment-based configuration helpers
// ============================================================================

// Get request timeout from environment, if set and sane
static std::optional<std::chrono::seconds> get_request_timeout() {
    if (const char* env = std::getenv("TUSCLIENT_REQUEST_TIMEOUT")) {
        try {
            unsigned long secs = std::stoul(env);
            // Sanity check: at least 5 seconds, at most 1 hour
            if (secs >= 5 && secs <= 3600) {
                return std::chrono::seconds(secs);
            }
            std::cerr << "warning: TUSCLIENT_REQUEST_TIMEOUT=" << env
                      << " out of range [5,3600], using default\n";
        } catch (const std::exception&) {
            std::cerr << "warning: invalid TUSCLIENT_REQUEST_TIMEOUT=" << env
                      << ", using default\n";
        }
    }
    return std::nullopt;
}

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::OPTIONS: return "OPTIONS";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= static_cast<int>(HttpStatus::OK) &&
           status < static_cast<int>(HttpStatus::MultipleChoices);
}

bool is_error_status(int status) {
    return status >= static_cast<int>(HttpStatus::BadRequest);
}

// ============================================================================
// HttpHeaders
// ============================================================================

HttpHeaders::HttpHeaders(std::initializer_list<std::pair<std::string, std::string>> init) {
    for (const auto& [name, value] : init) {
        set(name, value);
    }
}

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it == headers_.end() || it->second.empty()) {
        return std::nullopt;
    }
    if (it->second.size() == 1) {
        return it->second[0];
    }
    // Repeated fields are equivalent to one comma-separated field
    std::string joined;
    for (const auto& v : it->second) {
        if (!joined.empty()) joined += ", ";
        joined += v;
    }
    return joined;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::make(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t pos = 0;

    // Scheme
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    if (!std::isalpha(static_cast<unsigned char>(result.scheme[0])) ||
        !std::all_of(result.scheme.begin(), result.scheme.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '+' || c == '-' || c == '.';
        })) {
        return std::nullopt;
    }
    pos = scheme_end + 3;

    // Authority ends at the first of "/?#"
    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    // Userinfo (optional)
    size_t at_pos = url.find('@', pos);
    if (at_pos != std::string::npos && at_pos < host_end) {
        result.userinfo = url.substr(pos, at_pos - pos);
        pos = at_pos + 1;
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }

    if (host_port.front() == '[') {
        // IPv6 literal
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else {
        size_t colon_pos = host_port.rfind(':');
        if (colon_pos != std::string::npos) {
            result.host = host_port.substr(0, colon_pos);
            try {
                result.port = std::stoi(host_port.substr(colon_pos + 1));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        } else {
            result.host = host_port;
        }
    }

    pos = host_end;

    // Path
    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    // Query
    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
        pos = query_end;
    }

    // Fragment
    if (pos < url.size() && url[pos] == '#') {
        result.fragment = url.substr(pos + 1);
    }

    return result;
}

std::string ParsedUrl::origin() const {
    std::ostringstream oss;
    oss << scheme << "://";

    if (!userinfo.empty()) {
        oss << userinfo << "@";
    }

    if (host.find(':') != std::string::npos) {
        // IPv6
        oss << "[" << host << "]";
    } else {
        oss << host;
    }

    if (port != 0) {
        oss << ":" << port;
    }

    return oss.str();
}

std::string ParsedUrl::to_string() const {
    std::string result = origin() + path;

    if (!query.empty()) {
        result += "?" + query;
    }

    if (!fragment.empty()) {
        result += "#" + fragment;
    }

    return result;
}

std::string resolve_url(const std::string& base, const std::string& reference) {
    if (ParsedUrl::parse(reference)) {
        return reference;
    }

    auto parsed = ParsedUrl::parse(base);
    if (!parsed) {
        throw std::invalid_argument("not an absolute URL: " + base);
    }

    if (reference.empty()) {
        return base;
    }

    // Network-path reference
    if (reference.rfind("//", 0) == 0) {
        return parsed->scheme + ":" + reference;
    }

    // Query or fragment only: the base path is kept
    if (reference.front() == '?' || reference.front() == '#') {
        std::string result = parsed->origin() + parsed->path;
        if (reference.front() == '#' && !parsed->query.empty()) {
            result += "?" + parsed->query;
        }
        return result + reference;
    }

    // Absolute-path reference
    if (reference.front() == '/') {
        return parsed->origin() + reference;
    }

    // Relative-path reference: replace the last segment of the base path
    std::string dir = parsed->path;
    size_t slash = dir.rfind('/');
    dir = (slash == std::string::npos) ? "/" : dir.substr(0, slash + 1);
    return parsed->origin() + dir + reference;
}

std::string url_path(const std::string& url) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
        return url;
    }
    return parsed->path.empty() ? "/" : parsed->path;
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::vector<uint8_t>* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Return 0 to signal error and abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty()) {
        return bytes;
    }

    // A new status line starts a new response (interim 1xx, redirects);
    // only the final response's headers are kept.
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = (start == std::string::npos) ? std::string() : value.substr(start);
        size_t end = value.find_last_not_of(" \t");
        if (end != std::string::npos) value.erase(end + 1);

        headers->add(name, value);
    }

    return bytes;
}

static int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* callback = static_cast<const HttpProgressCallback*>(clientp);
    if (*callback && !(*callback)()) {
        return 1;  // Non-zero aborts the transfer
    }
    return 0;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        if (auto env_timeout = get_request_timeout()) {
            config_.default_total_timeout =
                std::chrono::duration_cast<std::chrono::milliseconds>(*env_timeout);
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

private:
    // Acquire a handle from the pool or create a new one
    CURL* acquire_handle() {
        std::lock_guard<std::mutex> lock(pool_mutex_);

        if (!idle_handles_.empty()) {
            CURL* handle = idle_handles_.back();
            idle_handles_.pop_back();
            return handle;
        }

        return curl_easy_init();
    }

    // Return a handle to the pool; its connection stays open for reuse
    void release_handle(CURL* handle) {
        if (!handle) return;

        std::lock_guard<std::mutex> lock(pool_mutex_);
        curl_easy_reset(handle);

        if (idle_handles_.size() < config_.max_total_connections) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    void apply_tls(CURL* curl, const HttpRequest& request) {
        if (request.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            static std::once_flag warning_flag;
            std::call_once(warning_flag, []() {
                std::cerr << "SECURITY WARNING: SSL verification disabled via configuration.\n"
                          << "This exposes connections to man-in-the-middle attacks.\n";
            });
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        if (!request.ca_bundle_path.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_bundle_path.c_str());
        }

        if (!request.pinned_public_key.empty()) {
            curl_easy_setopt(curl, CURLOPT_PINNEDPUBLICKEY, request.pinned_public_key.c_str());
        }
    }

public:
    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create connection handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        // Method. POST and PATCH always hand curl an explicit (possibly empty)
        // body so it never falls back to reading stdin.
        bool has_body_method = false;
        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                has_body_method = true;
                break;
            case HttpMethod::PATCH:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PATCH");
                has_body_method = true;
                break;
            case HttpMethod::OPTIONS:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "OPTIONS");
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        // Headers
        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        // Suppress "Expect: 100-continue" for chunk bodies
        headers_list = curl_slist_append(headers_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        if (has_body_method) {
            static const char empty_body[] = "";
            const char* data = request.body.empty()
                ? empty_body
                : reinterpret_cast<const char*>(request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        // Response callbacks with bounded size
        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{&response_body, config_.max_response_size, 0, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        if (request.progress_callback) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &request.progress_callback);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        // Timeouts: per-request values win over the client defaults
        auto connect_timeout = request.connect_timeout.count() > 0
            ? request.connect_timeout : config_.default_connect_timeout;
        auto total_timeout = request.total_timeout.count() > 0
            ? request.total_timeout : config_.default_total_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(total_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                             static_cast<long>(config_.tcp_keepalive_idle.count()));
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                             static_cast<long>(config_.tcp_keepalive_interval.count()));
        }

        apply_tls(curl, request);

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.is_network_error = true;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        curl_slist_free_all(headers_list);
        release_handle(curl);

        return response;
    }

private:
    HttpClientConfig config_;

    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

}  // namespace tusclient::net
