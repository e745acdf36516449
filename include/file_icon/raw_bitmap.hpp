#ifndef FILE_ICON_RAW_BITMAP_HPP_
#define FILE_ICON_RAW_BITMAP_HPP_

#include <file_icon/file_icon_export.h>
#include <file_icon/types.hpp>
#include <file_icon/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace file_icon {

// ============================================================================
// Raw Bitmap
// ============================================================================

/**
 * Device-dependent icon bitmap as handed over by an icon source.
 *
 * Layout follows the Windows DIB conventions used by icon resources:
 * - color rows are padded to 4 bytes, `bit_count` bits per pixel
 *   (1, 4, 8: palette indices; 16: X1R5G5B5; 24: BGR; 32: BGRA)
 * - palette entries are 4 bytes each in B, G, R, reserved order
 * - the mask is the 1-bit AND plane, rows padded to 4 bytes, a set bit
 *   marks a transparent pixel
 * - color and mask rows share the same row order (`top_down`)
 */
struct raw_bitmap {
    int width = 0;
    int height = 0;
    int bit_count = 0;
    bool top_down = false;

    std::vector<std::uint8_t> color;
    std::vector<std::uint8_t> palette;
    std::vector<std::uint8_t> mask;  // empty = no mask plane

    [[nodiscard]] std::size_t color_stride() const noexcept;
    [[nodiscard]] std::size_t mask_stride() const noexcept;
};

/**
 * True if the bitmap carries a usable native alpha channel: 32 bits per
 * pixel and at least one non-zero alpha byte. Legacy icons rendered into a
 * 32-bit DIB leave the alpha bytes zero and rely on the mask instead.
 */
[[nodiscard]] FILE_ICON_EXPORT bool has_native_alpha(const raw_bitmap& bmp) noexcept;

/**
 * Convert a raw bitmap to RGBA rows on a surface.
 *
 * Alpha comes from the native alpha channel for 32-bit bitmaps that have
 * one, from the mask plane otherwise. Without a mask every pixel is opaque.
 *
 * @param bmp Source bitmap
 * @param surf Destination surface, resized to the bitmap dimensions
 * @param max_dimension Largest accepted width or height
 * @return bitmap_unavailable if the bitmap is malformed or too large
 */
[[nodiscard]] FILE_ICON_EXPORT extract_result convert_bitmap(const raw_bitmap& bmp,
                                                             surface& surf,
                                                             int max_dimension = 1024);

} // namespace file_icon

#endif // FILE_ICON_RAW_BITMAP_HPP_
