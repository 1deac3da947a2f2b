#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lh {

// IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string format_http_date(std::int64_t epoch_sec);

// Parses IMF-fixdate only (what browsers send in If-Modified-Since).
// Returns epoch seconds on success.
std::optional<std::int64_t> parse_http_date(std::string_view s);

}
