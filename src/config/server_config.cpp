#include "local_https/server_config.hpp"
#include <charconv>
#include <string_view>

namespace lh {

namespace {

bool parse_port(std::string_view s, int* out) {
  int v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size()) return false;
  if (v < 1 || v > 65535) return false;
  *out = v;
  return true;
}

}

std::string usage() {
  return
    "Usage: local-https [--port=N] [--bind=HOST] [--root=DIR]\n"
    "                   [--cert=PATH] [--key=PATH]\n"
    "Serves DIR (default: current directory) over HTTPS on HOST:N\n"
    "(default: localhost:8443). A self-signed certificate is generated\n"
    "at PATH (default: server.crt / server.key) when either file is missing.\n";
}

CliResult parse_cli(int argc, char** argv, ServerConfig* out, std::string* err) {
  ServerConfig c = *out;
  for (int i = 1; i < argc; ++i) {
    std::string_view a(argv[i]);
    auto eat = [&](std::string_view pfx, std::string* dst) {
      if (a.substr(0, pfx.size()) != pfx) return false;
      *dst = std::string(a.substr(pfx.size()));
      return true;
    };
    std::string v;
    if (a == "-h" || a == "--help") return CliResult::Help;
    if (eat("--port=", &v)) {
      if (!parse_port(v, &c.port)) {
        if (err) *err = "invalid port: '" + v + "'";
        return CliResult::Error;
      }
      continue;
    }
    bool known = eat("--bind=", &c.bind_host) || eat("--root=", &c.document_root) ||
                 eat("--cert=", &c.cert_path) || eat("--key=", &c.key_path);
    if (!known) {
      if (err) *err = "unknown argument: '" + std::string(a) + "'";
      return CliResult::Error;
    }
    if (c.bind_host.empty() || c.document_root.empty() ||
        c.cert_path.empty() || c.key_path.empty()) {
      if (err) *err = "empty value in '" + std::string(a) + "'";
      return CliResult::Error;
    }
  }
  *out = std::move(c);
  return CliResult::Run;
}

}
