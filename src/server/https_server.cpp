#include "local_https/https_server.hpp"
#include "local_https/static_file_handler.hpp"
#include "local_https/tls_material.hpp"
#include <httplib.h>
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <atomic>
#include <cstring>
#include <mutex>
#include <pthread.h>
#include <thread>
#include <vector>
#include <sys/socket.h>

namespace lh {

namespace {

std::string log_timestamp() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%d/%b/%Y %H:%M:%S", &tm);
  return buf;
}

std::string content_length(const httplib::Response& res) {
  auto n = res.get_header_value("Content-Length");
  return n.empty() ? "-" : n;
}

void apply(const StaticReply& reply, httplib::Response& res) {
  res.status = reply.status;
  for (const auto& h : reply.headers) res.set_header(h.first, h.second);

  if (reply.file.empty()) {
    if (!reply.body.empty()) res.set_content(reply.body, reply.content_type);
    return;
  }
  if (reply.file_size == 0) {
    res.set_content(std::string(), reply.content_type);
    return;
  }

  auto in = std::make_shared<std::ifstream>(reply.file, std::ios::binary);
  const std::string path = reply.file.string();
  res.set_content_provider(
      static_cast<size_t>(reply.file_size), reply.content_type,
      [in, path](size_t offset, size_t length, httplib::DataSink& sink) {
        std::vector<char> buf(std::min<size_t>(length, 64 * 1024));
        in->clear();
        in->seekg(static_cast<std::streamoff>(offset));
        in->read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = in->gcount();
        if (got <= 0) {
          std::cerr << "[server] read failed: " << path << "\n";
          return false;
        }
        return sink.write(buf.data(), static_cast<size_t>(got));
      });
}

}

struct HttpsServer::Impl {
  Config cfg;
  std::string tls_error;
  StaticFileHandler files;
  httplib::SSLServer svr;
  int bound_port = -1;
  std::mutex log_mu;

  explicit Impl(Config c)
      : cfg(std::move(c)),
        files(cfg.document_root),
        svr([this](SSL_CTX& ctx) {
          return load_tls_material(ctx, cfg.cert_path, cfg.key_path, &tls_error);
        }) {}

  void routes() {
    svr.set_default_headers({{"Server", "local-https"}});

    // SO_REUSEADDR only. With httplib's default SO_REUSEPORT a second bind to
    // a busy port succeeds.
    svr.set_socket_options([](socket_t sock) {
      int yes = 1;
      if (::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0)
        std::cerr << "[server] setsockopt(SO_REUSEADDR) failed\n";
    });

    // HEAD is dispatched to the GET handler by httplib (body suppressed).
    svr.Get(".*", [this](const httplib::Request& req, httplib::Response& res) {
      const std::string ims = req.get_header_value("If-Modified-Since");
      apply(files.get(req.path, ims), res);
    });

    auto unsupported = [](const httplib::Request& req, httplib::Response& res) {
      apply(StaticFileHandler::error(501, "Unsupported method ('" + req.method + "')"), res);
    };
    svr.Post(".*", unsupported);
    svr.Put(".*", unsupported);
    svr.Patch(".*", unsupported);
    svr.Delete(".*", unsupported);
    svr.Options(".*", unsupported);

    if (cfg.access_log) {
      svr.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        std::lock_guard<std::mutex> lk(log_mu);
        std::cerr << req.remote_addr << " - - [" << log_timestamp() << "] \""
                  << req.method << ' ' << req.path << ' ' << req.version << "\" "
                  << res.status << ' ' << content_length(res) << "\n";
      });
    }
  }
};

HttpsServer::HttpsServer(Config cfg) : p_(new Impl(std::move(cfg))) { p_->routes(); }
HttpsServer::~HttpsServer() { delete p_; }

bool HttpsServer::start(std::string* err) {
  if (!p_->svr.is_valid()) {
    if (err) *err = p_->tls_error.empty() ? "TLS context setup failed" : p_->tls_error;
    return false;
  }
  if (p_->cfg.port == 0) {
    p_->bound_port = p_->svr.bind_to_any_port(p_->cfg.bind_host);
  } else if (p_->svr.bind_to_port(p_->cfg.bind_host, p_->cfg.port)) {
    p_->bound_port = p_->cfg.port;
  }
  if (p_->bound_port <= 0) {
    p_->bound_port = -1;
    if (err) *err = "cannot bind " + p_->cfg.bind_host + ":" + std::to_string(p_->cfg.port);
    return false;
  }
  return true;
}

int HttpsServer::run() {
  if (p_->bound_port < 0) return -1;
  return p_->svr.listen_after_bind() ? 0 : 1;
}

void HttpsServer::stop() { p_->svr.stop(); }
void HttpsServer::wait_until_ready() const { p_->svr.wait_until_ready(); }
bool HttpsServer::is_running() const { return p_->svr.is_running(); }
int HttpsServer::port() const { return p_->bound_port; }

int serve_until_signalled(HttpsServer& server, const sigset_t& signals, std::string* err) {
  int wake = 0;
  for (int s = 1; s < NSIG && !wake; ++s)
    if (sigismember(&signals, s) == 1) wake = s;
  if (!wake) {
    if (err) *err = "no stop signal given";
    return 1;
  }

  const pthread_t waiter = pthread_self();
  std::atomic<bool> stopping{false};
  std::atomic<bool> ended_early{false};
  std::atomic<int> run_rc{0};
  std::thread serve([&] {
    run_rc = server.run();
    if (!stopping) {
      ended_early = true;
      pthread_kill(waiter, wake);
    }
  });

  int sig = 0;
  if (int rc = sigwait(&signals, &sig); rc != 0)
    std::cerr << "[server] sigwait: " << std::strerror(rc) << "\n";

  stopping = true;
  server.stop();
  serve.join();

  if (ended_early) {
    if (err) *err = "listener exited unexpectedly (rc=" + std::to_string(run_rc.load()) + ")";
    return 1;
  }
  return 0;
}
