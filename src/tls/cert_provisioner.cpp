#include "local_https/cert_provisioner.hpp"
#include "local_https/tls_material.hpp"
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>

namespace lh {

namespace {

namespace fs = std::filesystem;

struct PkeyFree    { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct PkeyCtxFree { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct X509Free    { void operator()(X509* p) const { X509_free(p); } };
struct ExtFree     { void operator()(X509_EXTENSION* p) const { X509_EXTENSION_free(p); } };
struct BioFree     { void operator()(BIO* p) const { BIO_free(p); } };
struct BnFree      { void operator()(BIGNUM* p) const { BN_free(p); } };

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyFree>;
using X509Ptr = std::unique_ptr<X509, X509Free>;
using BioPtr  = std::unique_ptr<BIO, BioFree>;

bool fail(std::string* err, const std::string& what) {
  if (err) {
    std::string detail = openssl_error_string();
    *err = detail.empty() ? what : what + ": " + detail;
  }
  return false;
}

bool is_regular(const std::string& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec);
}

PkeyPtr make_rsa_key(int bits) {
  std::unique_ptr<EVP_PKEY_CTX, PkeyCtxFree> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
  if (!ctx) return nullptr;
  if (EVP_PKEY_keygen_init(ctx.get()) <= 0) return nullptr;
  if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) return nullptr;
  EVP_PKEY* raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) return nullptr;
  return PkeyPtr(raw);
}

bool add_ext(X509* cert, int nid, const std::string& value) {
  X509V3_CTX v3;
  X509V3_set_ctx_nodb(&v3);
  X509V3_set_ctx(&v3, cert, cert, nullptr, nullptr, 0);
  std::unique_ptr<X509_EXTENSION, ExtFree> ext(
      X509V3_EXT_conf_nid(nullptr, &v3, nid, value.c_str()));
  return ext && X509_add_ext(cert, ext.get(), -1) == 1;
}

std::string subject_alt_names(const std::string& cn) {
  if (cn == "localhost") return "DNS:localhost,IP:127.0.0.1,IP:::1";
  return "DNS:" + cn;
}

X509Ptr make_certificate(EVP_PKEY* key, const CertOptions& opts) {
  X509Ptr cert(X509_new());
  if (!cert) return nullptr;
  if (X509_set_version(cert.get(), 2) != 1) return nullptr;   // v3

  // 63 random bits keeps the serial positive.
  std::unique_ptr<BIGNUM, BnFree> bn(BN_new());
  if (!bn || BN_rand(bn.get(), 63, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1) return nullptr;
  if (!BN_to_ASN1_INTEGER(bn.get(), X509_get_serialNumber(cert.get()))) return nullptr;

  if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0)) return nullptr;
  if (!X509_gmtime_adj(X509_getm_notAfter(cert.get()),
                       static_cast<long>(opts.validity_days) * 24 * 60 * 60)) return nullptr;
  if (X509_set_pubkey(cert.get(), key) != 1) return nullptr;

  X509_NAME* name = X509_get_subject_name(cert.get());
  if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>(opts.common_name.c_str()),
        -1, -1, 0) != 1) return nullptr;
  if (X509_set_issuer_name(cert.get(), name) != 1) return nullptr;

  if (!add_ext(cert.get(), NID_basic_constraints, "CA:FALSE")) return nullptr;
  if (!add_ext(cert.get(), NID_subject_alt_name, subject_alt_names(opts.common_name))) return nullptr;
  if (!add_ext(cert.get(), NID_subject_key_identifier, "hash")) return nullptr;

  if (X509_sign(cert.get(), key, EVP_sha256()) <= 0) return nullptr;
  return cert;
}

std::string bio_to_string(BIO* bio) {
  char* data = nullptr;
  long n = BIO_get_mem_data(bio, &data);
  return (n > 0 && data) ? std::string(data, static_cast<std::size_t>(n)) : std::string();
}

// Write into `tmp`; the key file is restricted to the owner before any bytes land.
bool write_file(const fs::path& tmp, const std::string& bytes, bool secret, std::string* err) {
  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err) *err = "cannot create " + tmp.string();
    return false;
  }
  if (secret) {
    std::error_code ec;
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
      if (err) *err = "cannot restrict permissions on " + tmp.string() + ": " + ec.message();
      return false;
    }
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (!out) {
    if (err) *err = "short write to " + tmp.string();
    return false;
  }
  return true;
}

std::string asn1_cn(X509_NAME* name) {
  if (!name) return {};
  char buf[256] = {0};
  int n = X509_NAME_get_text_by_NID(name, NID_commonName, buf, sizeof(buf));
  return n > 0 ? std::string(buf, static_cast<std::size_t>(n)) : std::string();
}

bool asn1_to_epoch(const ASN1_TIME* t, std::int64_t* out) {
  std::tm tm{};
  if (!t || ASN1_TIME_to_tm(t, &tm) != 1) return false;
  *out = static_cast<std::int64_t>(timegm(&tm));
  return true;
}

}

bool certificate_files_exist(const CertOptions& opts) {
  return is_regular(opts.cert_path) && is_regular(opts.key_path);
}

bool generate_self_signed(const CertOptions& opts, std::string* err) {
  ERR_clear_error();
  if (opts.rsa_bits < 1024) return fail(err, "rsa key size too small");
  if (opts.validity_days <= 0) return fail(err, "validity must be at least one day");
  if (opts.common_name.empty()) return fail(err, "empty common name");

  PkeyPtr key = make_rsa_key(opts.rsa_bits);
  if (!key) return fail(err, "RSA key generation failed");
  X509Ptr cert = make_certificate(key.get(), opts);
  if (!cert) return fail(err, "certificate construction failed");

  BioPtr key_bio(BIO_new(BIO_s_mem()));
  BioPtr crt_bio(BIO_new(BIO_s_mem()));
  if (!key_bio || !crt_bio) return fail(err, "out of memory");
  if (PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
    return fail(err, "cannot encode private key");
  if (PEM_write_bio_X509(crt_bio.get(), cert.get()) != 1)
    return fail(err, "cannot encode certificate");

  const fs::path key_path(opts.key_path), crt_path(opts.cert_path);
  const fs::path key_tmp = key_path.string() + ".tmp";
  const fs::path crt_tmp = crt_path.string() + ".tmp";
  std::error_code ec;

  if (!write_file(key_tmp, bio_to_string(key_bio.get()), true, err)) {
    fs::remove(key_tmp, ec);
    return false;
  }
  if (!write_file(crt_tmp, bio_to_string(crt_bio.get()), false, err)) {
    fs::remove(key_tmp, ec);
    fs::remove(crt_tmp, ec);
    return false;
  }

  fs::rename(key_tmp, key_path, ec);
  if (ec) {
    if (err) *err = "cannot install " + key_path.string() + ": " + ec.message();
    fs::remove(key_tmp, ec);
    fs::remove(crt_tmp, ec);
    return false;
  }
  fs::rename(crt_tmp, crt_path, ec);
  if (ec) {
    if (err) *err = "cannot install " + crt_path.string() + ": " + ec.message();
    // Never leave a new key beside an old certificate.
    fs::remove(crt_tmp, ec);
    fs::remove(key_path, ec);
    return false;
  }
  return true;
}

bool ensure_certificate(const CertOptions& opts, CertPaths* out, std::string* err) {
  if (!certificate_files_exist(opts) && !generate_self_signed(opts, err)) return false;
  if (out) {
    out->cert_path = opts.cert_path;
    out->key_path  = opts.key_path;
  }
  return true;
}

bool describe_certificate(const std::string& cert_path, CertSummary* out, std::string* err) {
  ERR_clear_error();
  BioPtr bio(BIO_new_file(cert_path.c_str(), "r"));
  if (!bio) return fail(err, "cannot open " + cert_path);
  X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
  if (!cert) return fail(err, "cannot parse certificate " + cert_path);

  CertSummary s;
  s.subject_cn = asn1_cn(X509_get_subject_name(cert.get()));
  s.issuer_cn  = asn1_cn(X509_get_issuer_name(cert.get()));
  if (!asn1_to_epoch(X509_get0_notBefore(cert.get()), &s.not_before) ||
      !asn1_to_epoch(X509_get0_notAfter(cert.get()), &s.not_after))
    return fail(err, "cannot read validity of " + cert_path);

  EVP_PKEY* pub = X509_get0_pubkey(cert.get());
  s.key_bits = pub ? EVP_PKEY_bits(pub) : 0;
  s.self_signed = pub &&
                  X509_check_issued(cert.get(), cert.get()) == X509_V_OK &&
                  X509_verify(cert.get(), pub) == 1;
  ERR_clear_error();
  *out = std::move(s);
  return true;
}

}
