#include "local_https/static_file_handler.hpp"
#include "local_https/directory_listing.hpp"
#include "local_https/http_date.hpp"
#include "local_https/mime_types.hpp"
#include "local_https/path_utils.hpp"
#include <fstream>
#include <iostream>
#include <system_error>
#include <sys/stat.h>

namespace lh {

namespace fs = std::filesystem;

StaticFileHandler::StaticFileHandler(fs::path root) : root_(std::move(root)) {}

StaticReply StaticFileHandler::error(int status, std::string_view message) {
  StaticReply r;
  r.status = status;
  r.content_type = "text/html; charset=utf-8";
  const std::string code = std::to_string(status);
  const std::string msg = html_escape(message);
  r.body = "<!DOCTYPE HTML>\n<html lang=\"en\">\n<head>\n<meta charset=\"utf-8\">\n"
           "<title>Error response</title>\n</head>\n<body>\n<h1>Error response</h1>\n"
           "<p>Error code: " + code + "</p>\n<p>Message: " + msg + ".</p>\n</body>\n</html>\n";
  return r;
}

StaticReply StaticFileHandler::get(std::string_view url_path,
                                   std::string_view if_modified_since) const {
  // httplib has already split off the query and percent-decoded the path, so
  // '?' and '#' here are part of a file name.
  const std::string_view path_only = url_path;
  const fs::path target = translate_path(root_, path_only);
  std::error_code ec;

  if (fs::is_directory(target, ec)) {
    if (path_only.empty() || path_only.back() != '/') {
      StaticReply r = error(301, "Moved Permanently");
      r.headers.emplace_back("Location", percent_encode_path(path_only) + "/");
      return r;
    }
    for (const char* index : {"index.html", "index.htm"}) {
      const fs::path candidate = target / index;
      if (fs::is_regular_file(candidate, ec)) return serve_file(candidate, if_modified_since);
    }
    std::string err;
    auto html = render_directory_listing(path_only, target, &err);
    if (!html) {
      std::cerr << "[server] " << err << "\n";
      return error(404, "No permission to list directory");
    }
    StaticReply r;
    r.content_type = "text/html; charset=utf-8";
    r.body = std::move(*html);
    return r;
  }

  // "/file.txt/" names a directory that does not exist.
  if (!path_only.empty() && path_only.back() == '/') return error(404, "File not found");
  if (!fs::is_regular_file(target, ec)) return error(404, "File not found");
  return serve_file(target, if_modified_since);
}

StaticReply StaticFileHandler::serve_file(const fs::path& p,
                                          std::string_view if_modified_since) const {
  struct stat st{};
  if (::stat(p.c_str(), &st) != 0) return error(404, "File not found");
  {
    std::ifstream probe(p, std::ios::binary);
    if (!probe) return error(404, "File not found");
  }

  const std::int64_t mtime = static_cast<std::int64_t>(st.st_mtime);
  StaticReply r;
  r.headers.emplace_back("Last-Modified", format_http_date(mtime));

  if (!if_modified_since.empty()) {
    auto ims = parse_http_date(if_modified_since);
    if (ims && mtime <= *ims) {
      r.status = 304;
      return r;
    }
  }

  r.content_type = guess_mime(p.filename().string());
  r.file = p;
  r.file_size = static_cast<std::uint64_t>(st.st_size);
  return r;
}

}
