#include "tusclient/tls.hpp"
#include "tusclient/http.hpp"
#include "tusclient/metadata.hpp"

#include <openssl/pem.h>
#include <openssl/sha.h>
#include <openssl/x509.h>

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <vector>

namespace tusclient {

void TlsVerification::apply(net::HttpRequest& request) const {
    request.verify_ssl = verify;
    request.ca_bundle_path = ca_bundle_path;
    request.pinned_public_key = pinned_public_key;
}

std::string compute_spki_pin(const std::string& cert_pem_path) {
    std::unique_ptr<FILE, decltype(&fclose)> fp(fopen(cert_pem_path.c_str(), "r"), &fclose);
    if (!fp) {
        throw std::runtime_error("cannot open certificate file: " + cert_pem_path);
    }

    std::unique_ptr<X509, decltype(&X509_free)> cert(
        PEM_read_X509(fp.get(), nullptr, nullptr, nullptr), &X509_free);
    if (!cert) {
        throw std::runtime_error("cannot parse PEM certificate: " + cert_pem_path);
    }

    // DER encoding of the SubjectPublicKeyInfo
    int len = i2d_X509_PUBKEY(X509_get_X509_PUBKEY(cert.get()), nullptr);
    if (len <= 0) {
        throw std::runtime_error("cannot encode public key of: " + cert_pem_path);
    }
    std::vector<unsigned char> der(static_cast<size_t>(len));
    unsigned char* out = der.data();
    i2d_X509_PUBKEY(X509_get_X509_PUBKEY(cert.get()), &out);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(der.data(), der.size(), hash);

    return "sha256//" + base64_encode(hash, sizeof(hash));
}

}  // namespace tusclient
