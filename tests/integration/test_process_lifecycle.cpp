#include <httplib.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

int free_port() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  socklen_t len = sizeof(addr);
  int port = -1;
  if (fd >= 0 && ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
      ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0)
    port = ntohs(addr.sin_port);
  if (fd >= 0) ::close(fd);
  return port;
}

// Child runs `bin args...` inside `cwd`, stdout+stderr to `log`.
pid_t spawn(const std::string& bin, const fs::path& cwd, const fs::path& log,
            const std::vector<std::string>& args) {
  pid_t pid = ::fork();
  if (pid != 0) return pid;
  if (::chdir(cwd.c_str()) != 0) ::_exit(126);
  int fd = ::open(log.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd >= 0) { ::dup2(fd, 1); ::dup2(fd, 2); ::close(fd); }
  std::vector<char*> argv;
  argv.push_back(const_cast<char*>(bin.c_str()));
  for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);
  ::execv(bin.c_str(), argv.data());
  ::_exit(127);
}

// Exit status, or -1 if still running after `timeout`.
int wait_exit(pid_t pid, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    std::this_thread::sleep_for(50ms);
  }
  return -1;
}

bool wait_for_200(int port, const std::string& expect_body) {
  for (int i = 0; i < 100; ++i) {
    httplib::SSLClient cli("127.0.0.1", port);
    cli.enable_server_certificate_verification(false);
    cli.set_connection_timeout(1, 0);
    if (auto res = cli.Get("/index.html"))
      if (res->status == 200 && res->body == expect_body) return true;
    std::this_thread::sleep_for(100ms);
  }
  return false;
}

std::string slurp(const fs::path& p) {
  std::ifstream in(p);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

}

int main(int argc, char** argv) {
  if (argc < 2) { std::cerr << "usage: test_process_lifecycle <local-https binary>\n"; return 2; }
  const std::string bin = fs::absolute(argv[1]).string();
  const fs::path dir = fs::temp_directory_path() / ("lh-proc-" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir / "www");
  const std::string body = "served by a child process\n";
  std::ofstream(dir / "www" / "index.html") << body;

  int fails = 0;
  auto check = [&](bool ok, const std::string& what) {
    if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
  };

  // Certificate generation failure is fatal: nonzero exit, nothing served.
  {
    const int port = free_port();
    pid_t pid = spawn(bin, dir / "www", dir / "fail.log",
                      {"--bind=127.0.0.1", "--port=" + std::to_string(port),
                       "--cert=missing/dir/server.crt", "--key=missing/dir/server.key"});
    int rc = wait_exit(pid, 30s);
    if (rc == -1) { ::kill(pid, SIGKILL); ::waitpid(pid, nullptr, 0); }
    check(rc > 0 && rc != 127, "failed provisioning exits nonzero (rc=" + std::to_string(rc) + ")");
    check(slurp(dir / "fail.log").find("Failed to generate certificate.") != std::string::npos,
          "failure reported");
    httplib::SSLClient cli("127.0.0.1", port);
    cli.enable_server_certificate_verification(false);
    cli.set_connection_timeout(1, 0);
    check(!cli.Get("/index.html"), "nothing listening after fatal provisioning");
  }

  // Fresh start generates the pair, serves, and exits 0 on SIGINT.
  const int port = free_port();
  const std::vector<std::string> args = {"--bind=127.0.0.1", "--port=" + std::to_string(port)};
  {
    pid_t pid = spawn(bin, dir / "www", dir / "run1.log", args);
    check(wait_for_200(port, body), "child serves index.html over TLS");
    check(fs::is_regular_file(dir / "www" / "server.crt") &&
          fs::is_regular_file(dir / "www" / "server.key"), "certificate written to working directory");
    ::kill(pid, SIGINT);
    int rc = wait_exit(pid, 15s);
    if (rc == -1) { ::kill(pid, SIGKILL); ::waitpid(pid, nullptr, 0); }
    check(rc == 0, "SIGINT -> exit 0 (rc=" + std::to_string(rc) + ")");
    const std::string log = slurp(dir / "run1.log");
    check(log.find("Generating self-signed certificate...") != std::string::npos, "generation logged");
    check(log.find("Server stopped.") != std::string::npos, "stop logged");
  }

  // Second start reuses the pair untouched; SIGTERM also stops cleanly.
  {
    const auto mtime = fs::last_write_time(dir / "www" / "server.crt");
    pid_t pid = spawn(bin, dir / "www", dir / "run2.log", args);
    check(wait_for_200(port, body), "restart serves again");
    ::kill(pid, SIGTERM);
    int rc = wait_exit(pid, 15s);
    if (rc == -1) { ::kill(pid, SIGKILL); ::waitpid(pid, nullptr, 0); }
    check(rc == 0, "SIGTERM -> exit 0");
    check(fs::last_write_time(dir / "www" / "server.crt") == mtime, "certificate reused");
    check(slurp(dir / "run2.log").find("Certificate files already exist") != std::string::npos,
          "reuse logged");
  }

  // Port held by someone else -> bind failure is fatal.
  {
    int holder = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(static_cast<uint16_t>(port));
    bool held = holder >= 0 && ::bind(holder, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
                ::listen(holder, 1) == 0;
    check(held, "test could hold the port");
    pid_t pid = spawn(bin, dir / "www", dir / "run3.log", args);
    int rc = wait_exit(pid, 15s);
    if (rc == -1) { ::kill(pid, SIGKILL); ::waitpid(pid, nullptr, 0); }
    check(rc == 1, "bind failure exits 1 (rc=" + std::to_string(rc) + ")");
    if (holder >= 0) ::close(holder);
  }

  // Bad flags never start anything.
  {
    pid_t pid = spawn(bin, dir / "www", dir / "run4.log", {"--port=not-a-port"});
    check(wait_exit(pid, 10s) == 2, "bad flag exits 2");
  }

  std::error_code ec;
  fs::remove_all(dir, ec);
  if (fails) return 1;
  std::cout << "[PASS] process lifecycle: fatal startup errors, serve, signal shutdown\n";
  return 0;
}
