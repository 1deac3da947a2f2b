#include "local_https/http_date.hpp"
#include <ctime>
#include <cstdio>

namespace lh {

static const char* const kDays[]   = {"Sun","Mon","Tue","Wed","Thu","Fri","Sat"};
static const char* const kMonths[] = {"Jan","Feb","Mar","Apr","May","Jun",
                                      "Jul","Aug","Sep","Oct","Nov","Dec"};

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

std::string format_http_date(std::int64_t epoch_sec) {
  std::time_t t = static_cast<std::time_t>(epoch_sec);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                kDays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon],
                tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

std::optional<std::int64_t> parse_http_date(std::string_view s) {
  // "Sun, 06 Nov 1994 08:49:37 GMT"
  //  0    5  8   12   17 20 23 26
  if (s.size() != 29 || s[3] != ',' || s.substr(26) != "GMT") return std::nullopt;

  int D, Y, h, m, sec, M = -1;
  for (int i = 0; i < 12; ++i)
    if (s.substr(8, 3) == kMonths[i]) { M = i; break; }
  if (M < 0) return std::nullopt;

  if (!(parse_int(s.substr(5,2), D) && parse_int(s.substr(12,4), Y) &&
        parse_int(s.substr(17,2), h) && s[19]==':' && parse_int(s.substr(20,2), m) &&
        s[22]==':' && parse_int(s.substr(23,2), sec)))
    return std::nullopt;
  if (D < 1 || D > 31 || h > 23 || m > 59 || sec > 60) return std::nullopt;

  std::tm tm{}; tm.tm_year = Y - 1900; tm.tm_mon = M; tm.tm_mday = D;
  tm.tm_hour = h; tm.tm_min = m; tm.tm_sec = sec;
  std::time_t t = timegm(&tm);
  if (t == (std::time_t)-1) return std::nullopt;
  return static_cast<std::int64_t>(t);
}

}
