#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "tusclient/cancellation.hpp"
#include "tusclient/constants.hpp"
#include "tusclient/core.hpp"
#include "tusclient/error.hpp"
#include "tusclient/logging.hpp"
#include "tusclient/metadata.hpp"
#include "tusclient/tls.hpp"

namespace tusclient {

class UploadMetrics;

/// Retry policy shared by every remote call of one logical upload.
struct RetryConfiguration {
    // Number of attempts per operation (first try included)
    int retry_attempts = constants::DEFAULT_RETRY_ATTEMPTS;

    // Backoff grows as initial_retry_delay * 2^(attempt-1), capped here
    std::chrono::milliseconds max_retry_period = constants::DEFAULT_MAX_RETRY_PERIOD;
    std::chrono::milliseconds initial_retry_delay = constants::DEFAULT_INITIAL_RETRY_DELAY;

    TlsVerification tls;

    /// Delay to wait after the given (1-based) failed attempt.
    std::chrono::milliseconds backoff_delay(int attempt) const;

    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// An operation failed with a retryable error on every allowed attempt.
class RetryExhausted : public std::runtime_error {
public:
    RetryExhausted(const std::string& operation, int attempts, const std::string& last_error);

    const std::string& operation() const { return operation_; }
    int attempts() const { return attempts_; }
    const std::string& last_error() const { return last_error_; }

private:
    std::string operation_;
    int attempts_;
    std::string last_error_;
};

/// Run `fn` under the retry policy. Only retryable TusErrors trigger another
/// attempt; anything else propagates immediately. Backoff sleeps wake up on
/// cancellation and raise UploadCancelled.
template <typename Fn>
auto call_with_retry(const std::string& operation, const RetryConfiguration& config,
                     Logger& logger, const CancellationToken& cancel,
                     UploadMetrics* metrics, Fn&& fn) -> decltype(fn());

/// High-level entry points. Remote failures are logged and reported as
/// std::nullopt; only cancellation escapes as an exception (UploadCancelled).
class Uploader {
public:
    /// `session` is borrowed and must outlive the Uploader; when null, every
    /// call creates its own net::HttpClient and destroys it before returning.
    /// Throws std::invalid_argument if `config` is invalid.
    explicit Uploader(RetryConfiguration config = {},
                      std::shared_ptr<Logger> logger = nullptr,
                      net::HttpSession* session = nullptr);

    void set_metrics(UploadMetrics* metrics) { metrics_ = metrics; }

    /// Create an upload at `endpoint` and transfer `source` to it.
    /// Returns the (absolute) upload location on success.
    std::optional<std::string> upload(const std::string& endpoint, ByteSource& source,
                                      const Metadata& metadata = {},
                                      const net::HttpHeaders& headers = {},
                                      size_t chunksize = constants::DEFAULT_CHUNK_SIZE,
                                      const CancellationToken& cancel = {});

    /// Upload every source as a partial upload, then concatenate them, in
    /// source order, into a final upload carrying `metadata`.
    std::optional<std::string> upload_multiple(
        const std::string& endpoint, const std::vector<ByteSource*>& sources,
        const Metadata& metadata = {}, const net::HttpHeaders& headers = {},
        size_t chunksize = constants::DEFAULT_CHUNK_SIZE,
        size_t parallel_uploads = constants::DEFAULT_PARALLEL_UPLOADS,
        const CancellationToken& cancel = {});

    /// Read back the metadata of the upload at `location`.
    std::optional<Metadata> metadata(const std::string& location,
                                     const net::HttpHeaders& headers = {},
                                     const CancellationToken& cancel = {});

    const RetryConfiguration& config() const { return config_; }
    Logger& logger() const { return *logger_; }

private:
    // Borrowed session, or one owned for the duration of a single call
    class SessionScope;

    /// Retry-wrapped create + upload_buffer. Throws on failure.
    std::string create_and_transfer(net::HttpSession& session, const std::string& endpoint,
                                    ByteSource& source, const Metadata& metadata,
                                    const net::HttpHeaders& creation_headers,
                                    const net::HttpHeaders& headers, size_t chunksize,
                                    const CancellationToken& cancel);

    std::vector<std::string> upload_parts(net::HttpSession& session,
                                          const std::string& endpoint,
                                          const std::vector<ByteSource*>& sources,
                                          const net::HttpHeaders& headers,
                                          size_t chunksize, size_t parallel_uploads,
                                          const CancellationToken& cancel);

    RequestOptions make_options(const net::HttpHeaders& headers,
                                const CancellationToken& cancel) const;

    RetryConfiguration config_;
    std::shared_ptr<Logger> logger_;
    net::HttpSession* session_;
    UploadMetrics* metrics_ = nullptr;
};

namespace detail {
void note_retry(UploadMetrics* metrics, const std::string& operation);
std::string capitalize(const std::string& s);

// Joins every joinable thread in `threads` when it goes out of scope
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
    ~ThreadJoiner();

    ThreadJoiner(const ThreadJoiner&) = delete;
    ThreadJoiner& operator=(const ThreadJoiner&) = delete;

private:
    std::vector<std::thread>& threads_;
};
}  // namespace detail

template <typename Fn>
auto call_with_retry(const std::string& operation, const RetryConfiguration& config,
                     Logger& logger, const CancellationToken& cancel,
                     UploadMetrics* metrics, Fn&& fn) -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
        if (attempt > 1) {
            logger.info("Trying %s again, attempt number %d...", operation.c_str(), attempt);
        }
        cancel.throw_if_cancelled();

        try {
            return fn();
        } catch (const TusError& e) {
            if (!e.retryable()) throw;
            if (attempt >= config.retry_attempts) {
                throw RetryExhausted(operation, attempt, e.what());
            }

            auto delay = config.backoff_delay(attempt);
            logger.warning("%s failed, retrying in %.1f second(s): %s",
                           detail::capitalize(operation).c_str(),
                           std::chrono::duration<double>(delay).count(), e.what());
            detail::note_retry(metrics, operation);

            if (cancel.wait_for(delay)) {
                throw UploadCancelled();
            }
        }
    }
}

}  // namespace tusclient
