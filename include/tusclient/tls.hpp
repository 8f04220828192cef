#pragma once

#include <string>

namespace tusclient {

namespace net {
struct HttpRequest;
}

/// How the server certificate is checked. The default verifies against the
/// system trust store.
struct TlsVerification {
    bool verify = true;
    std::string ca_bundle_path;     // Empty = system default
    std::string pinned_public_key;  // "sha256//<base64>[;sha256//...]", empty = no pinning

    static TlsVerification disabled() {
        TlsVerification tls;
        tls.verify = false;
        return tls;
    }

    static TlsVerification with_ca_bundle(const std::string& path) {
        TlsVerification tls;
        tls.ca_bundle_path = path;
        return tls;
    }

    static TlsVerification pinned(const std::string& spki_pin) {
        TlsVerification tls;
        tls.pinned_public_key = spki_pin;
        return tls;
    }

    /// Copy the settings onto an outgoing request.
    void apply(net::HttpRequest& request) const;
};

/// Compute the libcurl pin ("sha256//<base64>") of the SubjectPublicKeyInfo
/// of the first certificate in a PEM file. Throws std::runtime_error if the
/// file cannot be read or parsed.
std::string compute_spki_pin(const std::string& cert_pem_path);

}  // namespace tusclient
