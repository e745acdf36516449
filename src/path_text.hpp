#pragma once

#include <filesystem>
#include <string>

namespace file_icon {

// UTF-8 rendering of a path for messages; path::string() may throw or
// lose characters on Windows
inline std::string describe(const std::filesystem::path& path) {
    const auto utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
}

} // namespace file_icon
