#include "local_https/mime_types.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace lh {

namespace {

struct MimeEntry { const char* ext; const char* type; };

const MimeEntry kTable[] = {
  {".html",  "text/html; charset=utf-8"},
  {".htm",   "text/html; charset=utf-8"},
  {".css",   "text/css; charset=utf-8"},
  {".js",    "text/javascript; charset=utf-8"},
  {".mjs",   "text/javascript; charset=utf-8"},
  {".json",  "application/json"},
  {".txt",   "text/plain; charset=utf-8"},
  {".md",    "text/markdown; charset=utf-8"},
  {".csv",   "text/csv; charset=utf-8"},
  {".xml",   "text/xml; charset=utf-8"},
  {".svg",   "image/svg+xml"},
  {".png",   "image/png"},
  {".jpg",   "image/jpeg"},
  {".jpeg",  "image/jpeg"},
  {".gif",   "image/gif"},
  {".webp",  "image/webp"},
  {".ico",   "image/vnd.microsoft.icon"},
  {".wasm",  "application/wasm"},
  {".pdf",   "application/pdf"},
  {".zip",   "application/zip"},
  {".gz",    "application/gzip"},
  {".mp3",   "audio/mpeg"},
  {".wav",   "audio/wav"},
  {".ogg",   "audio/ogg"},
  {".mp4",   "video/mp4"},
  {".webm",  "video/webm"},
  {".woff",  "font/woff"},
  {".woff2", "font/woff2"},
  {".ttf",   "font/ttf"},
};

}

std::string guess_mime(std::string_view name) {
  auto ends = [&](const char* s){
    const size_t n = std::strlen(s), m = name.size();
    return m >= n && std::equal(s, s+n, name.data() + (m - n),
                                [](char a, char b){
                                  return std::tolower(static_cast<unsigned char>(a)) ==
                                         std::tolower(static_cast<unsigned char>(b));
                                });
  };
  for (const auto& e : kTable)
    if (ends(e.ext)) return e.type;
  return "application/octet-stream";
}

}
