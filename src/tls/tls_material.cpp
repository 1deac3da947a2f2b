#include "local_https/tls_material.hpp"
#include <openssl/err.h>

namespace lh {

std::string openssl_error_string() {
  std::string out;
  unsigned long code = 0;
  while ((code = ERR_get_error()) != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    if (!out.empty()) out += "; ";
    out += buf;
  }
  return out;
}

bool load_tls_material(SSL_CTX& ctx,
                       const std::string& cert_path,
                       const std::string& key_path,
                       std::string* err) {
  ERR_clear_error();
  // httplib applies these only in its path-based constructor.
  if (SSL_CTX_set_min_proto_version(&ctx, TLS1_2_VERSION) != 1) {
    if (err) *err = "cannot require TLS 1.2: " + openssl_error_string();
    return false;
  }
  SSL_CTX_set_options(&ctx, SSL_OP_NO_COMPRESSION | SSL_OP_NO_SESSION_RESUMPTION_ON_RENEGOTIATION);

  if (SSL_CTX_use_certificate_chain_file(&ctx, cert_path.c_str()) != 1) {
    if (err) *err = "cannot load certificate " + cert_path + ": " + openssl_error_string();
    return false;
  }
  if (SSL_CTX_use_PrivateKey_file(&ctx, key_path.c_str(), SSL_FILETYPE_PEM) != 1) {
    if (err) *err = "cannot load private key " + key_path + ": " + openssl_error_string();
    return false;
  }
  if (SSL_CTX_check_private_key(&ctx) != 1) {
    if (err) *err = "private key " + key_path + " does not match " + cert_path +
                    ": " + openssl_error_string();
    return false;
  }
  return true;
}

}
