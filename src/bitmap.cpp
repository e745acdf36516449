#include <file_icon/raw_bitmap.hpp>
#include "bitmap_helpers.hpp"
#include "byte_io.hpp"

#include <string>
#include <vector>

namespace file_icon {

namespace {

// Mask bit for (x, row); 1 = transparent
bool mask_bit(const std::uint8_t* mask_row, int x) {
    return (mask_row[x / 8] >> (7 - (x % 8))) & 1;
}

extract_result validate(const raw_bitmap& bmp, int max_dimension) {
    if (bmp.width <= 0 || bmp.height <= 0) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Bitmap has no pixels");
    }
    if (bmp.width > max_dimension || bmp.height > max_dimension) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Bitmap " + std::to_string(bmp.width) + "x" + std::to_string(bmp.height) +
            " exceeds limit of " + std::to_string(max_dimension));
    }
    if (!is_valid_bit_count(bmp.bit_count)) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Unsupported bit depth: " + std::to_string(bmp.bit_count));
    }

    const std::size_t rows = static_cast<std::size_t>(bmp.height);
    if (bmp.color.size() < bmp.color_stride() * rows) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Color plane is truncated");
    }
    if (!bmp.mask.empty() && bmp.mask.size() < bmp.mask_stride() * rows) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Mask plane is truncated");
    }
    if ((bmp.bit_count == 4 || bmp.bit_count == 8) && bmp.palette.size() < 4) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Indexed bitmap without palette");
    }
    return extract_result::success();
}

} // namespace

std::size_t raw_bitmap::color_stride() const noexcept {
    return row_stride_4byte(width, bit_count);
}

std::size_t raw_bitmap::mask_stride() const noexcept {
    return row_stride_4byte(width, 1);
}

bool has_native_alpha(const raw_bitmap& bmp) noexcept {
    if (bmp.bit_count != 32 || bmp.width <= 0 || bmp.height <= 0) {
        return false;
    }
    const std::size_t stride = bmp.color_stride();
    const std::size_t rows = static_cast<std::size_t>(bmp.height);
    if (bmp.color.size() < stride * rows) {
        return false;
    }
    for (std::size_t y = 0; y < rows; ++y) {
        const std::uint8_t* row = bmp.color.data() + y * stride;
        for (int x = 0; x < bmp.width; ++x) {
            if (row[static_cast<std::size_t>(x) * 4 + 3] != 0) {
                return true;
            }
        }
    }
    return false;
}

extract_result convert_bitmap(const raw_bitmap& bmp, surface& surf, int max_dimension) {
    auto result = validate(bmp, max_dimension);
    if (!result) return result;

    if (!surf.set_size(bmp.width, bmp.height)) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Failed to allocate pixel buffer");
    }

    const bool native_alpha = has_native_alpha(bmp);
    const bool use_mask = !native_alpha && !bmp.mask.empty();

    // 1-bit bitmaps without a color table are monochrome: 0 = black, 1 = white
    static constexpr std::uint8_t MONO_PALETTE[] = {0, 0, 0, 0, 0xFF, 0xFF, 0xFF, 0};
    const std::uint8_t* palette = bmp.palette.data();
    std::size_t palette_colors = bmp.palette.size() / 4;
    if (bmp.bit_count == 1 && palette_colors == 0) {
        palette = MONO_PALETTE;
        palette_colors = 2;
    }

    const std::size_t color_stride = bmp.color_stride();
    const std::size_t mask_stride = bmp.mask_stride();
    std::vector<std::uint8_t> row_out(static_cast<std::size_t>(bmp.width) * 4);

    for (int y = 0; y < bmp.height; ++y) {
        const int src_y = bmp.top_down ? y : bmp.height - 1 - y;
        const std::uint8_t* src_row = bmp.color.data() + static_cast<std::size_t>(src_y) * color_stride;
        const std::uint8_t* mask_row = use_mask
            ? bmp.mask.data() + static_cast<std::size_t>(src_y) * mask_stride
            : nullptr;

        for (int x = 0; x < bmp.width; ++x) {
            std::uint8_t r = 0, g = 0, b = 0, a = 0xFF;

            if (bmp.bit_count <= 8) {
                const std::uint8_t idx = extract_index(src_row, x, bmp.bit_count);
                if (idx < palette_colors) {
                    const std::uint8_t* pal = palette + static_cast<std::size_t>(idx) * 4;
                    b = pal[0];
                    g = pal[1];
                    r = pal[2];
                }
            } else if (bmp.bit_count == 16) {
                // X1R5G5B5
                const std::uint16_t pixel = read_le16(src_row + x * 2);
                r = static_cast<std::uint8_t>(((pixel >> 10) & 0x1F) << 3);
                g = static_cast<std::uint8_t>(((pixel >> 5) & 0x1F) << 3);
                b = static_cast<std::uint8_t>((pixel & 0x1F) << 3);
            } else if (bmp.bit_count == 24) {
                const std::uint8_t* p = src_row + x * 3;
                b = p[0];
                g = p[1];
                r = p[2];
            } else {
                const std::uint8_t* p = src_row + x * 4;
                b = p[0];
                g = p[1];
                r = p[2];
                if (native_alpha) {
                    a = p[3];
                }
            }

            if (mask_row && mask_bit(mask_row, x)) {
                a = 0;
            }

            std::uint8_t* dst = row_out.data() + static_cast<std::size_t>(x) * 4;
            dst[0] = r;
            dst[1] = g;
            dst[2] = b;
            dst[3] = a;
        }

        surf.write_row(y, row_out.data());
    }

    return extract_result::success();
}

} // namespace file_icon
