#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace tusclient {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Upload counters kept in a prometheus::Registry. prometheus-cpp metrics are
/// thread-safe, so one instance can be shared by concurrent part uploads.
class UploadMetrics {
public:
    explicit UploadMetrics(const std::map<std::string, std::string>& labels = {});

    UploadMetrics(const UploadMetrics&) = delete;
    UploadMetrics& operator=(const UploadMetrics&) = delete;

    void record_request(const std::string& method);
    void record_retry(const std::string& operation);

    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Histogram& upload_duration() { return *upload_duration_; }

    /// Serialize in the Prometheus text format (temp file + rename).
    /// Returns false if the file could not be written.
    bool write_textfile(const std::filesystem::path& path) const;

    std::string serialize() const;

private:
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* requests_family_;
    prometheus::Family<prometheus::Counter>* retries_family_;

    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Histogram* upload_duration_;
};

}  // namespace tusclient
