#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lh {

// Transport-neutral answer for one request. When `file` is set the body is
// that file's bytes (streamed by the caller); otherwise `body`.
struct StaticReply {
  int status = 200;
  std::string content_type;
  std::string body;
  std::filesystem::path file;
  std::uint64_t file_size = 0;
  std::vector<std::pair<std::string, std::string>> headers;
};

// GET/HEAD semantics of a plain static file server rooted at a directory:
// files with a guessed Content-Type, index.html/index.htm for directories,
// generated listings otherwise, 301 to add a missing trailing slash, 304 for
// a fresh If-Modified-Since, 404 for anything that does not resolve.
class StaticFileHandler {
public:
  explicit StaticFileHandler(std::filesystem::path root);

  // `url_path` is already percent-decoded.
  StaticReply get(std::string_view url_path,
                  std::string_view if_modified_since = {}) const;

  static StaticReply error(int status, std::string_view message);

  const std::filesystem::path& root() const noexcept { return root_; }

private:
  StaticReply serve_file(const std::filesystem::path& p,
                         std::string_view if_modified_since) const;

  std::filesystem::path root_;
};

}
