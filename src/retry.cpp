#include "tusclient/retry.hpp"
#include "tusclient/creation.hpp"
#include "tusclient/metrics.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace tusclient {

// --- RetryConfiguration ---

std::chrono::milliseconds RetryConfiguration::backoff_delay(int attempt) const {
    if (attempt < 1) attempt = 1;
    auto delay = initial_retry_delay;
    for (int i = 1; i < attempt && delay < max_retry_period; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_retry_period);
}

std::string RetryConfiguration::validate() const {
    if (retry_attempts < 1) return "retry_attempts must be >= 1";
    if (max_retry_period.count() < 0) return "max_retry_period must be >= 0";
    if (initial_retry_delay.count() < 0) return "initial_retry_delay must be >= 0";
    return {};
}

RetryExhausted::RetryExhausted(const std::string& operation, int attempts,
                               const std::string& last_error)
    : std::runtime_error(last_error)
    , operation_(operation)
    , attempts_(attempts)
    , last_error_(last_error) {}

namespace detail {

void note_retry(UploadMetrics* metrics, const std::string& operation) {
    if (metrics) metrics->record_retry(operation);
}

ThreadJoiner::~ThreadJoiner() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

std::string capitalize(const std::string& s) {
    std::string result = s;
    if (!result.empty()) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

}  // namespace detail

namespace {

// Counts requests per method before handing them to the real session
class InstrumentedSession : public net::HttpSession {
public:
    InstrumentedSession(net::HttpSession& inner, UploadMetrics& metrics)
        : inner_(inner), metrics_(metrics) {}

    net::HttpResponse execute(const net::HttpRequest& request) override {
        metrics_.record_request(net::http_method_to_string(request.method));
        return inner_.execute(request);
    }

private:
    net::HttpSession& inner_;
    UploadMetrics& metrics_;
};

}  // namespace

// Borrowed session, or an HttpClient owned until the end of one call
class Uploader::SessionScope {
public:
    SessionScope(net::HttpSession* borrowed, UploadMetrics* metrics) {
        if (borrowed) {
            session_ = borrowed;
        } else {
            owned_ = std::make_unique<net::HttpClient>();
            session_ = owned_.get();
        }
        if (metrics) {
            instrumented_ = std::make_unique<InstrumentedSession>(*session_, *metrics);
            session_ = instrumented_.get();
        }
    }

    net::HttpSession& get() { return *session_; }

private:
    std::unique_ptr<net::HttpClient> owned_;
    std::unique_ptr<InstrumentedSession> instrumented_;
    net::HttpSession* session_ = nullptr;
};

// --- Uploader ---

Uploader::Uploader(RetryConfiguration config, std::shared_ptr<Logger> logger,
                   net::HttpSession* session)
    : config_(std::move(config))
    , logger_(logger ? std::move(logger) : default_logger())
    , session_(session) {
    auto err = config_.validate();
    if (!err.empty()) {
        throw std::invalid_argument("invalid retry configuration: " + err);
    }
}

RequestOptions Uploader::make_options(const net::HttpHeaders& headers,
                                      const CancellationToken& cancel) const {
    RequestOptions options;
    options.headers = headers;
    options.tls = config_.tls;
    options.cancel = cancel;
    options.logger = logger_.get();
    return options;
}

std::string Uploader::create_and_transfer(net::HttpSession& session, const std::string& endpoint,
                                          ByteSource& source, const Metadata& metadata,
                                          const net::HttpHeaders& creation_headers,
                                          const net::HttpHeaders& headers, size_t chunksize,
                                          const CancellationToken& cancel) {
    auto create_options = make_options(creation_headers, cancel);
    auto location = call_with_retry("upload creation", config_, *logger_, cancel, metrics_, [&] {
        return creation::create(session, endpoint, &source, metadata, create_options);
    });

    location = net::resolve_url(endpoint, location);

    // Separate attempt counter: a flaky creation does not eat into the
    // transfer's budget
    auto transfer_options = make_options(headers, cancel);
    call_with_retry("upload", config_, *logger_, cancel, metrics_, [&] {
        core::upload_buffer(session, location, source, transfer_options, chunksize);
    });

    return location;
}

std::optional<std::string> Uploader::upload(const std::string& endpoint, ByteSource& source,
                                            const Metadata& metadata,
                                            const net::HttpHeaders& headers, size_t chunksize,
                                            const CancellationToken& cancel) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->upload_duration());

    try {
        // Cheap local check before any connection is opened
        check_metadata_keys(metadata);

        SessionScope scope(session_, metrics_);
        auto location = create_and_transfer(scope.get(), endpoint, source, metadata,
                                            headers, headers, chunksize, cancel);
        if (metrics_) {
            metrics_->uploads_success().Increment();
            metrics_->upload_bytes_total().Increment(
                static_cast<double>(source.size()));
        }
        return location;
    } catch (const UploadCancelled&) {
        throw;
    } catch (const RetryExhausted& e) {
        logger_->error("Unable to upload file, even after retrying: %s", e.what());
    } catch (const std::exception& e) {
        logger_->error("Unable to upload file: %s", e.what());
    }

    if (metrics_) metrics_->uploads_failure().Increment();
    return std::nullopt;
}

std::vector<std::string> Uploader::upload_parts(net::HttpSession& session,
                                                const std::string& endpoint,
                                                const std::vector<ByteSource*>& sources,
                                                const net::HttpHeaders& headers,
                                                size_t chunksize, size_t parallel_uploads,
                                                const CancellationToken& cancel) {
    net::HttpHeaders partial_headers = headers;
    partial_headers.set("Upload-Concat", "partial");

    // Cancelled by the caller, or by us when a sibling part fails
    CancellationToken group = cancel.child();

    std::vector<std::string> paths(sources.size());
    std::atomic<size_t> next{0};
    std::mutex failure_mutex;
    std::string failure;

    auto record_failure = [&](const std::string& message) {
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (failure.empty()) {
            failure = message;
            logger_->info("Cancelling other uploads...");
            group.cancel();
        }
    };

    auto worker = [&]() {
        while (!group.is_cancelled()) {
            size_t i = next.fetch_add(1);
            if (i >= sources.size()) return;

            try {
                auto location = create_and_transfer(session, endpoint, *sources[i], {},
                                                    partial_headers, headers, chunksize, group);
                paths[i] = net::url_path(location);
                if (metrics_) {
                    metrics_->upload_bytes_total().Increment(
                        static_cast<double>(sources[i]->size()));
                }
            } catch (const UploadCancelled&) {
                return;
            } catch (const std::exception& e) {
                logger_->error("Unable to upload part %zu: %s", i, e.what());
                record_failure(e.what());
                return;
            }
        }
    };

    size_t worker_count = std::min(parallel_uploads, sources.size());
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    {
        detail::ThreadJoiner joiner(workers);
        for (size_t i = 0; i < worker_count; ++i) {
            try {
                workers.emplace_back(worker);
            } catch (const std::system_error& e) {
                if (workers.empty()) {
                    record_failure(std::string("cannot start upload thread: ") + e.what());
                } else {
                    logger_->warning("Continuing with %zu upload thread(s): %s",
                                     workers.size(), e.what());
                }
                break;
            }
        }
    }

    cancel.throw_if_cancelled();
    if (!failure.empty()) {
        throw std::runtime_error("Upload of a part failed: " + failure);
    }
    return paths;
}

std::optional<std::string> Uploader::upload_multiple(const std::string& endpoint,
                                                     const std::vector<ByteSource*>& sources,
                                                     const Metadata& metadata,
                                                     const net::HttpHeaders& headers,
                                                     size_t chunksize, size_t parallel_uploads,
                                                     const CancellationToken& cancel) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->upload_duration());

    try {
        check_metadata_keys(metadata);
        if (sources.empty()) {
            throw std::invalid_argument("no sources to upload");
        }
        if (std::find(sources.begin(), sources.end(), nullptr) != sources.end()) {
            throw std::invalid_argument("null source");
        }
        if (parallel_uploads < 1) {
            throw std::invalid_argument("parallel_uploads must be >= 1");
        }

        SessionScope scope(session_, metrics_);
        auto& session = scope.get();
        auto options = make_options(headers, cancel);

        auto server_config = call_with_retry(
            "query configuration", config_, *logger_, cancel, metrics_,
            [&] { return core::configuration(session, endpoint, options); });

        if (!server_config.supports(constants::CONCATENATION_EXTENSION)) {
            throw TusError::unsupported_extension(constants::CONCATENATION_EXTENSION);
        }

        auto paths = upload_parts(session, endpoint, sources, headers, chunksize,
                                  parallel_uploads, cancel);

        std::string concat = "final;";
        for (size_t i = 0; i < paths.size(); ++i) {
            if (i > 0) concat += " ";
            concat += paths[i];
        }

        auto final_options = make_options(headers, cancel);
        final_options.headers.set("Upload-Concat", concat);

        auto location = call_with_retry("upload creation", config_, *logger_, cancel, metrics_, [&] {
            return creation::create(session, endpoint, nullptr, metadata, final_options);
        });

        if (metrics_) metrics_->uploads_success().Increment();
        return net::resolve_url(endpoint, location);
    } catch (const UploadCancelled&) {
        throw;
    } catch (const RetryExhausted& e) {
        logger_->error("Unable to upload files, even after retrying: %s", e.what());
    } catch (const std::exception& e) {
        logger_->error("Unable to upload files: %s", e.what());
    }

    if (metrics_) metrics_->uploads_failure().Increment();
    return std::nullopt;
}

std::optional<Metadata> Uploader::metadata(const std::string& location,
                                           const net::HttpHeaders& headers,
                                           const CancellationToken& cancel) {
    try {
        SessionScope scope(session_, metrics_);
        auto options = make_options(headers, cancel);
        return call_with_retry("query metadata", config_, *logger_, cancel, metrics_, [&] {
            return core::metadata(scope.get(), location, options);
        });
    } catch (const UploadCancelled&) {
        throw;
    } catch (const RetryExhausted& e) {
        logger_->error("Unable to get metadata, even after retrying: %s", e.what());
    } catch (const std::exception& e) {
        logger_->error("Unable to get metadata: %s", e.what());
    }
    return std::nullopt;
}

}  // namespace tusclient
