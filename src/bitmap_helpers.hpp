#pragma once

#include <cstddef>
#include <cstdint>

namespace file_icon {

// Row stride calculation (4-byte aligned, DIB rows and AND masks)
inline std::size_t row_stride_4byte(int width, int bits_per_pixel) {
    return ((static_cast<std::size_t>(width) * static_cast<std::size_t>(bits_per_pixel) + 31) / 32) * 4;
}

// Extract palette index from packed data (1, 4 or 8 bits per pixel)
inline std::uint8_t extract_index(const std::uint8_t* row, int x, int bits_per_pixel) {
    switch (bits_per_pixel) {
        case 1: {
            int byte_index = x / 8;
            int bit_index = 7 - (x % 8);
            return (row[byte_index] >> bit_index) & 0x01;
        }
        case 4: {
            int byte_index = x / 2;
            int bit_index = (x % 2) ? 0 : 4;
            return (row[byte_index] >> bit_index) & 0x0F;
        }
        case 8:
            return row[x];
        default:
            return 0;
    }
}

inline bool is_valid_bit_count(int bit_count) {
    return bit_count == 1 || bit_count == 4 || bit_count == 8 ||
           bit_count == 16 || bit_count == 24 || bit_count == 32;
}

} // namespace file_icon
