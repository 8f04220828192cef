#include "tusclient/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace tusclient {

UploadMetrics::UploadMetrics(const std::map<std::string, std::string>& labels)
    : registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    requests_family_ = &prometheus::BuildCounter()
        .Name("tusclient_requests_total")
        .Help("Total HTTP requests sent to the tus server")
        .Labels(labels)
        .Register(*registry_);

    retries_family_ = &prometheus::BuildCounter()
        .Name("tusclient_retries_total")
        .Help("Total retries after a retryable failure")
        .Labels(labels)
        .Register(*registry_);

    auto& uploads_family = prometheus::BuildCounter()
        .Name("tusclient_uploads_total")
        .Help("Total uploads completed")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("tusclient_upload_bytes_total")
        .Help("Total bytes uploaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("tusclient_upload_duration_seconds")
        .Help("Upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

void UploadMetrics::record_request(const std::string& method) {
    requests_family_->Add({{"method", method}}).Increment();
}

void UploadMetrics::record_retry(const std::string& operation) {
    retries_family_->Add({{"operation", operation}}).Increment();
}

std::string UploadMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

bool UploadMetrics::write_textfile(const std::filesystem::path& path) const {
    auto tmp_path = path;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        return false;
    }
    return true;
}

}  // namespace tusclient
