#include "local_https/directory_listing.hpp"
#include "local_https/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace lh {

namespace fs = std::filesystem;

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::optional<std::vector<ListingEntry>> list_directory(const fs::path& dir, std::string* err) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    if (err) *err = "cannot list " + dir.string() + ": " + ec.message();
    return std::nullopt;
  }

  std::vector<std::string> names;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    names.push_back(it->path().filename().string());
  }
  if (ec) {
    if (err) *err = "cannot list " + dir.string() + ": " + ec.message();
    return std::nullopt;
  }
  std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) {
    return lower(a) < lower(b);
  });

  std::vector<ListingEntry> out;
  out.reserve(names.size());
  for (const auto& name : names) {
    const fs::path full = dir / name;
    std::error_code sec;
    ListingEntry e{name, name};
    if (fs::is_directory(full, sec)) { e.display += '/'; e.href += '/'; }
    if (fs::is_symlink(full, sec)) e.display = name + '@';
    e.href = percent_encode_path(e.href);
    out.push_back(std::move(e));
  }
  return out;
}

std::optional<std::string> render_directory_listing(std::string_view url_path,
                                                    const fs::path& dir,
                                                    std::string* err) {
  auto entries = list_directory(dir, err);
  if (!entries) return std::nullopt;

  const std::string title = "Directory listing for " + html_escape(url_path);
  std::string html = "<!DOCTYPE HTML>\n<html lang=\"en\">\n<head>\n"
                     "<meta charset=\"utf-8\">\n<title>";
  html += title + "</title>\n</head>\n<body>\n<h1>" + title + "</h1>\n<hr>\n<ul>\n";
  for (const auto& e : *entries) {
    html += "<li><a href=\"" + html_escape(e.href) + "\">" + html_escape(e.display) + "</a></li>\n";
  }
  html += "</ul>\n<hr>\n</body>\n</html>\n";
  return html;
}

}
