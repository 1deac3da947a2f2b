#pragma once
#include <signal.h>
#include <string>

namespace lh {

// cpp-httplib SSLServer serving a directory tree read-only.
class HttpsServer {
public:
  struct Config {
    std::string bind_host     = "localhost";
    int port = 8443;                 // 0 = pick any free port
    std::string cert_path     = "server.crt";
    std::string key_path      = "server.key";
    std::string document_root = ".";
    bool access_log = true;          // one line per request on stderr
  };

  explicit HttpsServer(Config cfg);
  ~HttpsServer();

  HttpsServer(const HttpsServer&) = delete;
  HttpsServer& operator=(const HttpsServer&) = delete;

  // Load TLS material, then bind. Returns false (with *err) on either failure;
  // nothing is accepted before this succeeds.
  bool start(std::string* err = nullptr);

  // Blocking accept loop after start(); returns 0 once stop() is called,
  // non-zero if the listener was never bound or failed.
  int run();

  // Thread-safe; unblocks run().
  void stop();

  void wait_until_ready() const;
  bool is_running() const;

  // Bound port (useful with Config::port == 0); -1 before start().
  int port() const;

private:
  struct Impl;
  Impl* p_;
};

// Runs the accept loop on a worker thread until one of `signals` (blocked in
// every thread by the caller) arrives, then stops it. Returns 0 on a signal,
// 1 if the loop ended on its own first.
int serve_until_signalled(HttpsServer& server, const sigset_t& signals,
                          std::string* err = nullptr);

}
