#pragma once
#include <string>

namespace lh {

struct ServerConfig {
  std::string bind_host     = "localhost";
  int         port          = 8443;   // >= 1024, no root needed
  std::string document_root = ".";
  std::string cert_path     = "server.crt";
  std::string key_path      = "server.key";
  std::string common_name   = "localhost";
  int         validity_days = 365;
  int         rsa_bits      = 2048;
};

enum class CliResult { Run, Help, Error };

// Accepts --port=N --bind=HOST --root=DIR --cert=PATH --key=PATH and -h/--help.
// Everything is optional; no arguments means defaults.
CliResult parse_cli(int argc, char** argv, ServerConfig* out,
                    std::string* err = nullptr);

std::string usage();

}
