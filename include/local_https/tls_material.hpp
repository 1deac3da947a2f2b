#pragma once
#include <string>
#include <openssl/ssl.h>

namespace lh {

// Drains the OpenSSL error queue into a single line ("" if empty).
std::string openssl_error_string();

// Require TLS >= 1.2 without compression, then load a PEM certificate chain
// + private key into a server context and verify that the key belongs to
// the certificate.
bool load_tls_material(SSL_CTX& ctx,
                       const std::string& cert_path,
                       const std::string& key_path,
                       std::string* err = nullptr);

}
