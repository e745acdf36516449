#ifndef FILE_ICON_BASE64_HPP_
#define FILE_ICON_BASE64_HPP_

#include <file_icon/file_icon_export.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace file_icon {

inline constexpr std::string_view PNG_DATA_URL_PREFIX = "data:image/png;base64,";

/**
 * Encode bytes as standard base64 (RFC 4648 alphabet, '=' padding).
 */
[[nodiscard]] FILE_ICON_EXPORT std::string encode_base64(std::span<const std::uint8_t> data);

/**
 * Decode standard base64 text. Padding is required, whitespace is not
 * accepted.
 * @return Decoded bytes, or std::nullopt if the text is not valid base64
 */
[[nodiscard]] FILE_ICON_EXPORT std::optional<std::vector<std::uint8_t>> decode_base64(std::string_view text);

/**
 * Encode PNG bytes as a "data:image/png;base64,..." URL.
 */
[[nodiscard]] FILE_ICON_EXPORT std::string to_png_data_url(std::span<const std::uint8_t> png);

} // namespace file_icon

#endif // FILE_ICON_BASE64_HPP_
