#include "tusclient/byte_source.hpp"
#include "tusclient/client_config.hpp"
#include "tusclient/error.hpp"
#include "tusclient/logging.hpp"
#include "tusclient/metrics.hpp"
#include "tusclient/retry.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <thread>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

constexpr int EXIT_CANCELLED = 130;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

// Turns a signal into a cancellation outside signal context
class SignalWatcher {
public:
    explicit SignalWatcher(tusclient::CancellationToken token) : token_(std::move(token)) {
        thread_ = std::thread([this] {
            while (!done_) {
                if (g_shutdown_requested) {
                    token_.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });
    }

    ~SignalWatcher() {
        done_ = true;
        if (thread_.joinable()) thread_.join();
    }

private:
    tusclient::CancellationToken token_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

std::string lowercase_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

const char* guess_mime_type(const std::filesystem::path& path) {
    static const std::pair<const char*, const char*> types[] = {
        {".txt", "text/plain"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/x-wav"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
    };

    auto ext = lowercase_extension(path);
    for (const auto& [suffix, type] : types) {
        if (ext == suffix) return type;
    }
    return nullptr;
}

// Printable ASCII as is, everything else escaped
std::string escape_value(const tusclient::Bytes& value) {
    std::string out;
    for (uint8_t c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default:
                if (c >= 0x20 && c < 0x7f) {
                    out += static_cast<char>(c);
                } else {
                    char buf[5];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                }
        }
    }
    return out;
}

int run_upload(const tusclient::ClientConfig& config, tusclient::Uploader& uploader,
               const tusclient::CancellationToken& cancel) {
    const auto& file = config.files.front();

    tusclient::Metadata metadata;
    metadata["filename"] = tusclient::to_bytes(file.filename().string());
    if (const char* mime_type = guess_mime_type(file)) {
        metadata["mime_type"] = tusclient::to_bytes(mime_type);
    }
    for (const auto& [key, value] : config.metadata) {
        metadata[key] = value;
    }

    tusclient::FileByteSource source(file);
    auto location = uploader.upload(config.url, source, metadata, config.headers,
                                    config.chunk_size, cancel);
    if (!location) return 1;

    std::cout << *location << std::endl;
    return 0;
}

int run_upload_multiple(const tusclient::ClientConfig& config, tusclient::Uploader& uploader,
                        const tusclient::CancellationToken& cancel) {
    std::vector<std::unique_ptr<tusclient::FileByteSource>> files;
    std::vector<tusclient::ByteSource*> sources;
    for (const auto& path : config.files) {
        files.push_back(std::make_unique<tusclient::FileByteSource>(path));
        sources.push_back(files.back().get());
    }

    auto location = uploader.upload_multiple(config.url, sources, config.metadata,
                                             config.headers, config.chunk_size,
                                             config.parallel_uploads, cancel);
    if (!location) return 1;

    std::cout << *location << std::endl;
    return 0;
}

int run_metadata(const tusclient::ClientConfig& config, tusclient::Uploader& uploader,
                 const tusclient::CancellationToken& cancel) {
    auto metadata = uploader.metadata(config.url, config.headers, cancel);
    if (!metadata) return 1;

    for (const auto& [key, value] : *metadata) {
        if (value) {
            std::cout << key << ": " << escape_value(*value) << "\n";
        } else {
            std::cout << key << "\n";
        }
    }
    std::cout.flush();
    return 0;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = tusclient::ClientConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    auto logger = std::make_shared<tusclient::ConsoleLogger>(
        config.debug ? tusclient::LogLevel::Debug : tusclient::LogLevel::Info);

    std::unique_ptr<tusclient::Uploader> uploader;
    try {
        uploader = std::make_unique<tusclient::Uploader>(config.retry_config(), logger);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<tusclient::UploadMetrics> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<tusclient::UploadMetrics>(
            std::map<std::string, std::string>{{"command", config.command}});
        uploader->set_metrics(metrics.get());
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    tusclient::CancellationToken cancel;
    int status = 1;
    {
        SignalWatcher watcher(cancel);
        try {
            if (config.command == "upload") {
                status = run_upload(config, *uploader, cancel);
            } else if (config.command == "upload-multiple") {
                status = run_upload_multiple(config, *uploader, cancel);
            } else {
                status = run_metadata(config, *uploader, cancel);
            }
        } catch (const tusclient::UploadCancelled&) {
            logger->error("Operation cancelled.");
            status = EXIT_CANCELLED;
        } catch (const std::exception& e) {
            logger->error("%s", e.what());
            status = 1;
        }
    }

    if (metrics && !metrics->write_textfile(config.metrics_file)) {
        logger->warning("Unable to write metrics to %s", config.metrics_file.c_str());
    }

    return status;
}
