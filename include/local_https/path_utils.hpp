#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace lh {

// Map an already percent-decoded URL path onto `root`.
// The query must already be removed: '?' and '#' are ordinary name
// characters here. Empty, "." and ".." segments are ignored, so the result
// never escapes root. A trailing '/' is kept as a trailing separator on the
// returned path.
std::filesystem::path translate_path(const std::filesystem::path& root,
                                     std::string_view url_path);

// Percent-encode everything except unreserved characters and '/'.
std::string percent_encode_path(std::string_view s);

std::string html_escape(std::string_view s);

}
