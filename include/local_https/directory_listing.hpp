#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lh {

struct ListingEntry {
  std::string display;   // "name", "name/" for directories, "name@" for symlinks
  std::string href;      // percent-encoded, relative to the listed directory
};

// Immediate entries of `dir`, sorted case-insensitively.
// nullopt if the directory cannot be read.
std::optional<std::vector<ListingEntry>> list_directory(const std::filesystem::path& dir,
                                                        std::string* err = nullptr);

// HTML page titled "Directory listing for <url_path>".
std::optional<std::string> render_directory_listing(std::string_view url_path,
                                                    const std::filesystem::path& dir,
                                                    std::string* err = nullptr);

}
