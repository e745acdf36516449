#ifndef FILE_ICON_CODECS_PNG_HPP_
#define FILE_ICON_CODECS_PNG_HPP_

#include <file_icon/file_icon_export.h>
#include <file_icon/types.hpp>
#include <file_icon/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace file_icon {

// PNG signature: 89 50 4E 47 0D 0A 1A 0A
inline constexpr std::uint8_t PNG_SIGNATURE[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

// ============================================================================
// PNG Decoding
// ============================================================================

/**
 * Check if data starts with the PNG signature.
 * @param data Raw file data
 */
[[nodiscard]] FILE_ICON_EXPORT bool is_png(std::span<const std::uint8_t> data) noexcept;

/**
 * Decode PNG data to RGBA rows on a surface.
 * Used for PNG-compressed icon entries and for verifying encoder output.
 * @param data Raw PNG data
 * @param surf Destination surface
 * @param max_dimension Largest accepted width or height
 * @return bitmap_unavailable if the data is not a decodable PNG
 */
[[nodiscard]] FILE_ICON_EXPORT extract_result decode_png(std::span<const std::uint8_t> data,
                                                         surface& surf,
                                                         int max_dimension = 1024);

// ============================================================================
// PNG Encoding
// ============================================================================

/**
 * Encode a pixel buffer to PNG (RGBA, 8 bits per channel).
 * @param pixels Source pixels
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] FILE_ICON_EXPORT std::vector<std::uint8_t> encode_png(const pixel_buffer& pixels);

/**
 * Encode a pixel buffer to PNG and write it to a file.
 * @param pixels Source pixels
 * @param path Output file path
 * @return true on success
 */
[[nodiscard]] FILE_ICON_EXPORT bool save_png(const pixel_buffer& pixels,
                                             const std::filesystem::path& path);

/**
 * Write already encoded bytes to a file.
 * @return true on success
 */
[[nodiscard]] FILE_ICON_EXPORT bool write_file(std::span<const std::uint8_t> data,
                                               const std::filesystem::path& path);

} // namespace file_icon

#endif // FILE_ICON_CODECS_PNG_HPP_
