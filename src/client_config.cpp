#include "tusclient/client_config.hpp"
#include "tusclient/header_utils.hpp"
#include "tusclient/tls.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace tusclient {

namespace {

void print_usage() {
    std::cerr <<
        "Usage: tus-upload [options] upload <endpoint> <file>\n"
        "       tus-upload [options] upload-multiple <endpoint> <file>...\n"
        "       tus-upload [options] metadata <location>\n"
        "\n"
        "Commands:\n"
        "  upload                           Upload a file to a tus server\n"
        "  upload-multiple                  Upload files as parts and concatenate them\n"
        "  metadata                         Print the metadata of an upload\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --metadata <key[=value]>         Additional metadata (repeatable)\n"
        "  --header <'Name: value'>         Extra HTTP header for every request (repeatable)\n"
        "  --retry-attempts <N>             Attempts per operation (default: 10)\n"
        "  --max-retry-period <secs>        Maximum backoff delay (default: 60)\n"
        "  --retry-delay-ms <ms>            Initial backoff delay (default: 1000)\n"
        "  --chunk-size <bytes>             Bytes per PATCH request (default: 4194304)\n"
        "  --parallel-uploads <N>           Concurrent part uploads (default: 3)\n"
        "  --no-verify-ssl                  Skip SSL verification\n"
        "  --ca-cert <path>                 CA bundle for SSL verification\n"
        "  --pin-public-key <sha256//...>   Pin the server's public key\n"
        "  --pin-cert <path>                Pin the public key of a PEM certificate\n"
        "  --metrics-file <path>            Write Prometheus metrics to this .prom file\n"
        "  --debug                          Log debug messages\n"
        "  --help                           Show this help\n"
        "\n"
        "Environment:\n"
        "  TUSCLIENT_REQUEST_TIMEOUT        HTTP request timeout in seconds (5-3600)\n";
}

// Parse a non-negative integer option value, reporting errors on stderr
template <typename T>
bool parse_number(const char* name, const char* value, T& out) {
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(value, &pos);
        if (pos != std::strlen(value) || value[0] == '-') {
            throw std::invalid_argument(value);
        }
        if (v > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            throw std::out_of_range(value);
        }
        out = static_cast<T>(v);
        return true;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: " << name << " is out of range: " << value << "\n";
        return false;
    } catch (const std::exception&) {
        std::cerr << "Error: " << name << " expects a non-negative integer, got: "
                  << value << "\n";
        return false;
    }
}

}  // namespace

void parse_metadata_arg(const std::string& arg, Metadata& metadata) {
    auto eq = arg.find('=');
    if (eq == std::string::npos) {
        metadata[arg] = std::nullopt;
    } else {
        metadata[arg.substr(0, eq)] = to_bytes(arg.substr(eq + 1));
    }
}

bool parse_header_arg(const std::string& arg, net::HttpHeaders& headers) {
    auto colon = arg.find(':');
    if (colon == std::string::npos) return false;

    auto name = trim(arg.substr(0, colon));
    if (name.empty() || name.find(' ') != std::string::npos) return false;

    headers.add(name, trim(arg.substr(colon + 1)));
    return true;
}

std::optional<ClientConfig> ClientConfig::from_args(int argc, char* argv[]) {
    ClientConfig config;
    std::vector<std::string> positional;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--metadata") {
            auto* v = next_arg(i, "--metadata");
            if (!v) return std::nullopt;
            parse_metadata_arg(v, config.metadata);
        } else if (arg == "--header") {
            auto* v = next_arg(i, "--header");
            if (!v) return std::nullopt;
            if (!parse_header_arg(v, config.headers)) {
                std::cerr << "Error: malformed header (expected 'Name: value'): " << v << "\n";
                return std::nullopt;
            }
        } else if (arg == "--retry-attempts") {
            auto* v = next_arg(i, "--retry-attempts");
            if (!v || !parse_number("--retry-attempts", v, config.retry_attempts)) {
                return std::nullopt;
            }
        } else if (arg == "--max-retry-period") {
            auto* v = next_arg(i, "--max-retry-period");
            uint64_t secs = 0;
            if (!v || !parse_number("--max-retry-period", v, secs)) return std::nullopt;
            config.max_retry_period = std::chrono::seconds(secs);
        } else if (arg == "--retry-delay-ms") {
            auto* v = next_arg(i, "--retry-delay-ms");
            uint64_t ms = 0;
            if (!v || !parse_number("--retry-delay-ms", v, ms)) return std::nullopt;
            config.initial_retry_delay = std::chrono::milliseconds(ms);
        } else if (arg == "--chunk-size") {
            auto* v = next_arg(i, "--chunk-size");
            if (!v || !parse_number("--chunk-size", v, config.chunk_size)) return std::nullopt;
        } else if (arg == "--parallel-uploads") {
            auto* v = next_arg(i, "--parallel-uploads");
            if (!v || !parse_number("--parallel-uploads", v, config.parallel_uploads)) {
                return std::nullopt;
            }
        } else if (arg == "--no-verify-ssl") {
            config.verify_ssl = false;
        } else if (arg == "--ca-cert") {
            auto* v = next_arg(i, "--ca-cert");
            if (!v) return std::nullopt;
            config.ca_cert_path = v;
        } else if (arg == "--pin-public-key") {
            auto* v = next_arg(i, "--pin-public-key");
            if (!v) return std::nullopt;
            config.pinned_public_key = v;
        } else if (arg == "--pin-cert") {
            auto* v = next_arg(i, "--pin-cert");
            if (!v) return std::nullopt;
            config.pin_cert_path = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--debug") {
            config.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        std::cerr << "No command specified.\n\n";
        print_usage();
        return std::nullopt;
    }

    config.command = positional[0];
    if (positional.size() > 1) config.url = positional[1];
    for (size_t i = 2; i < positional.size(); ++i) {
        config.files.emplace_back(positional[i]);
    }
    return config;
}

bool ClientConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("retry_attempts")) retry_attempts = j["retry_attempts"].get<int>();
        if (j.contains("max_retry_period"))
            max_retry_period = std::chrono::seconds(j["max_retry_period"].get<uint64_t>());
        if (j.contains("retry_delay_ms"))
            initial_retry_delay = std::chrono::milliseconds(j["retry_delay_ms"].get<uint64_t>());
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<size_t>();
        if (j.contains("parallel_uploads")) parallel_uploads = j["parallel_uploads"].get<size_t>();
        if (j.contains("verify_ssl")) verify_ssl = j["verify_ssl"].get<bool>();
        if (j.contains("ca_cert")) ca_cert_path = j["ca_cert"].get<std::string>();
        if (j.contains("pin_public_key")) pinned_public_key = j["pin_public_key"].get<std::string>();
        if (j.contains("pin_cert")) pin_cert_path = j["pin_cert"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("debug")) debug = j["debug"].get<bool>();

        // "metadata": {"key": "value", "flag": null}
        if (j.contains("metadata") && j["metadata"].is_object()) {
            for (auto& [key, val] : j["metadata"].items()) {
                if (val.is_null()) {
                    metadata[key] = std::nullopt;
                } else {
                    metadata[key] = to_bytes(val.get<std::string>());
                }
            }
        }

        if (j.contains("headers") && j["headers"].is_object()) {
            for (auto& [key, val] : j["headers"].items()) {
                headers.set(key, val.get<std::string>());
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

std::string ClientConfig::validate() const {
    if (command != "upload" && command != "upload-multiple" && command != "metadata") {
        return "unknown command: " + command;
    }
    if (url.empty()) {
        return command == "metadata" ? "upload location is required"
                                     : "creation endpoint is required";
    }

    if (command == "upload" && files.size() != 1) return "upload expects exactly one file";
    if (command == "upload-multiple" && files.empty()) return "upload-multiple expects at least one file";
    if (command == "metadata" && !files.empty()) return "metadata takes no files";

    for (const auto& file : files) {
        if (!std::filesystem::exists(file)) return "file does not exist: " + file.string();
        if (!std::filesystem::is_regular_file(file)) return "not a regular file: " + file.string();
    }

    if (retry_attempts < 1) return "retry_attempts must be >= 1";
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (parallel_uploads == 0) return "parallel_uploads must be >= 1";
    if (!pin_cert_path.empty() && !std::filesystem::exists(pin_cert_path))
        return "pin certificate does not exist: " + pin_cert_path.string();
    if (!ca_cert_path.empty() && !std::filesystem::exists(ca_cert_path))
        return "CA certificate does not exist: " + ca_cert_path;
    return {};
}

RetryConfiguration ClientConfig::retry_config() const {
    RetryConfiguration retry;
    retry.retry_attempts = retry_attempts;
    retry.max_retry_period = max_retry_period;
    retry.initial_retry_delay = initial_retry_delay;

    retry.tls.verify = verify_ssl;
    retry.tls.ca_bundle_path = ca_cert_path;
    retry.tls.pinned_public_key = pinned_public_key;
    if (!pin_cert_path.empty()) {
        // libcurl accepts several pins separated by ';'
        auto pin = compute_spki_pin(pin_cert_path.string());
        if (retry.tls.pinned_public_key.empty()) {
            retry.tls.pinned_public_key = pin;
        } else {
            retry.tls.pinned_public_key += ";" + pin;
        }
    }
    return retry;
}

}  // namespace tusclient
