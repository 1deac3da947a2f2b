#pragma once
#include <cstdint>
#include <string>

namespace lh {

struct CertOptions {
  std::string cert_path   = "server.crt";
  std::string key_path    = "server.key";
  std::string common_name = "localhost";
  int validity_days = 365;
  int rsa_bits      = 2048;
};

struct CertPaths {
  std::string cert_path;
  std::string key_path;
};

// What describe_certificate() reads back from a PEM certificate.
struct CertSummary {
  std::string subject_cn;
  std::string issuer_cn;
  std::int64_t not_before = 0;   // seconds since epoch, UTC
  std::int64_t not_after  = 0;
  int key_bits = 0;
  bool self_signed = false;
};

// True when a regular file exists at both paths. Nothing else is checked.
bool certificate_files_exist(const CertOptions& opts);

// Fast path: both files exist -> return them untouched, trusted as-is
// (no expiry, pairing or subject check). Otherwise generate a fresh pair.
// Returns false if generation fails; callers treat that as fatal.
bool ensure_certificate(const CertOptions& opts, CertPaths* out,
                        std::string* err = nullptr);

// Always (re)writes both files: RSA key, self-signed X.509 v3 cert,
// subject = issuer = CN=<common_name>, valid for validity_days from now.
bool generate_self_signed(const CertOptions& opts, std::string* err = nullptr);

bool describe_certificate(const std::string& cert_path, CertSummary* out,
                          std::string* err = nullptr);

}
