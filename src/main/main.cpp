#include "local_https/cert_provisioner.hpp"
#include "local_https/https_server.hpp"
#include "local_https/server_config.hpp"

#include <csignal>
#include <cstring>
#include <iostream>
#include <pthread.h>
#include <string>

namespace {

bool provision(const lh::ServerConfig& cfg, lh::CertPaths* out) {
  lh::CertOptions opts;
  opts.cert_path     = cfg.cert_path;
  opts.key_path      = cfg.key_path;
  opts.common_name   = cfg.common_name;
  opts.validity_days = cfg.validity_days;
  opts.rsa_bits      = cfg.rsa_bits;

  if (lh::certificate_files_exist(opts)) {
    std::cout << "Certificate files already exist: " << opts.cert_path
              << " and " << opts.key_path << "\n";
    return lh::ensure_certificate(opts, out);
  }

  std::cout << "Generating self-signed certificate..." << std::endl;
  std::string err;
  if (!lh::ensure_certificate(opts, out, &err)) {
    std::cerr << "[cert] " << err << "\n";
    std::cout << "Failed to generate certificate." << std::endl;
    return false;
  }
  std::cout << "Certificate generated: " << out->cert_path << " and " << out->key_path << "\n";

  lh::CertSummary s;
  if (lh::describe_certificate(out->cert_path, &s, &err)) {
    const auto days = (s.not_after - s.not_before) / 86400;
    std::cout << "[cert] CN=" << s.subject_cn << ", RSA-" << s.key_bits
              << ", valid " << days << " days\n";
  }
  return true;
}

}

int main(int argc, char** argv) {
  lh::ServerConfig cfg;
  std::string cli_err;
  switch (lh::parse_cli(argc, argv, &cfg, &cli_err)) {
    case lh::CliResult::Help:
      std::cout << lh::usage();
      return 0;
    case lh::CliResult::Error:
      std::cerr << cli_err << "\n" << lh::usage();
      return 2;
    case lh::CliResult::Run:
      break;
  }

  lh::CertPaths paths;
  if (!provision(cfg, &paths)) return 1;

  // Block SIGINT/SIGTERM before any thread exists so that only sigwait()
  // below sees them; httplib's workers inherit the mask.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  if (int rc = pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr); rc != 0) {
    std::cerr << "[server] pthread_sigmask: " << std::strerror(rc) << "\n";
    return 1;
  }

  lh::HttpsServer::Config scfg;
  scfg.bind_host     = cfg.bind_host;
  scfg.port          = cfg.port;
  scfg.cert_path     = paths.cert_path;
  scfg.key_path      = paths.key_path;
  scfg.document_root = cfg.document_root;

  lh::HttpsServer server(scfg);
  std::string err;
  if (!server.start(&err)) {
    std::cerr << "[server] " << err << "\n";
    std::cerr << "Server failed to start on " << cfg.bind_host << ":" << cfg.port << "\n";
    return 1;
  }

  std::cout << "Server running at https://" << cfg.bind_host << ":" << server.port() << "/\n"
            << "Note: You'll need to accept the self-signed certificate warning in your browser.\n"
            << "Press Ctrl+C to stop the server." << std::endl;

  if (lh::serve_until_signalled(server, stop_signals, &err) != 0) {
    std::cerr << "[server] " << err << "\n";
    return 1;
  }
  std::cout << "\nServer stopped." << std::endl;
  return 0;
}
