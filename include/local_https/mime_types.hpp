#pragma once
#include <string>
#include <string_view>

namespace lh {

// Content-Type for a file name, chosen by (case-insensitive) extension.
// Unknown extensions map to application/octet-stream.
std::string guess_mime(std::string_view name);

}
