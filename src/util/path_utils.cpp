#include "local_https/path_utils.hpp"
#include <cstdio>

namespace lh {

std::filesystem::path translate_path(const std::filesystem::path& root,
                                     std::string_view url_path) {
  std::string_view p = url_path;
  const bool trailing = !p.empty() && p.back() == '/';

  std::filesystem::path out = root;
  std::size_t pos = 0;
  while (pos <= p.size()) {
    auto next = p.find('/', pos);
    if (next == std::string_view::npos) next = p.size();
    std::string_view word = p.substr(pos, next - pos);
    pos = next + 1;
    if (word.empty() || word == "." || word == "..") continue;
    if (word.find('\0') != std::string_view::npos) continue;
#if defined(_WIN32)
    if (word.find('\\') != std::string_view::npos || word.find(':') != std::string_view::npos) continue;
#endif
    out /= std::string(word);
  }
  if (trailing) out /= "";
  return out;
}

std::string percent_encode_path(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    bool keep = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                c == '.' || c == '~' || c == '/';
    if (keep) { out.push_back(static_cast<char>(c)); continue; }
    char buf[4];
    std::snprintf(buf, sizeof(buf), "%%%02X", c);
    out += buf;
  }
  return out;
}

std::string html_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&':  out += "&amp;";  break;
      case '<':  out += "&lt;";   break;
      case '>':  out += "&gt;";   break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&#x27;"; break;
      default:   out.push_back(c);
    }
  }
  return out;
}

}
