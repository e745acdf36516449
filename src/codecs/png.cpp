#include <file_icon/codecs/png.hpp>
#include "../byte_io.hpp"
#include <lodepng.h>

#include <fstream>
#include <limits>
#include <string>

namespace file_icon {

namespace {

constexpr std::size_t PNG_SIGNATURE_SIZE = sizeof(PNG_SIGNATURE);

// IHDR chunk structure:
// Offset 8-11: IHDR length (should be 13)
// Offset 12-15: IHDR type ("IHDR" = 0x49484452)
// Offset 16-19: Width (big-endian)
// Offset 20-23: Height (big-endian)
constexpr std::size_t PNG_IHDR_LENGTH_OFFSET = 8;
constexpr std::size_t PNG_IHDR_TYPE_OFFSET = 12;
constexpr std::size_t PNG_IHDR_WIDTH_OFFSET = 16;
constexpr std::size_t PNG_IHDR_HEIGHT_OFFSET = 20;
constexpr std::size_t PNG_MIN_SIZE_FOR_DIMENSIONS = 24;
constexpr std::uint32_t PNG_IHDR_TYPE = 0x49484452;
constexpr std::uint32_t PNG_IHDR_LENGTH = 13;

extract_result too_large(std::uint32_t w, std::uint32_t h, int max_dimension) {
    return extract_result::failure(extract_error::bitmap_unavailable,
        "PNG " + std::to_string(w) + "x" + std::to_string(h) +
        " exceeds limit of " + std::to_string(max_dimension));
}

} // namespace

bool is_png(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < PNG_SIGNATURE_SIZE) {
        return false;
    }

    for (std::size_t i = 0; i < PNG_SIGNATURE_SIZE; ++i) {
        if (data[i] != PNG_SIGNATURE[i]) {
            return false;
        }
    }

    return true;
}

extract_result decode_png(std::span<const std::uint8_t> data, surface& surf, int max_dimension) {
    if (!is_png(data)) {
        return extract_result::failure(extract_error::bitmap_unavailable, "Not a valid PNG");
    }

    const auto limit = static_cast<std::uint32_t>(max_dimension > 0 ? max_dimension : 0);

    // Pre-decode dimension check from IHDR chunk to avoid inflating huge images
    if (data.size() >= PNG_MIN_SIZE_FOR_DIMENSIONS) {
        std::uint32_t ihdr_length = read_be32(data.data() + PNG_IHDR_LENGTH_OFFSET);
        std::uint32_t ihdr_type = read_be32(data.data() + PNG_IHDR_TYPE_OFFSET);

        if (ihdr_length == PNG_IHDR_LENGTH && ihdr_type == PNG_IHDR_TYPE) {
            std::uint32_t ihdr_width = read_be32(data.data() + PNG_IHDR_WIDTH_OFFSET);
            std::uint32_t ihdr_height = read_be32(data.data() + PNG_IHDR_HEIGHT_OFFSET);
            if (ihdr_width > limit || ihdr_height > limit) {
                return too_large(ihdr_width, ihdr_height, max_dimension);
            }
        }
    }

    unsigned width = 0;
    unsigned height = 0;
    std::vector<std::uint8_t> pixels;

    unsigned error = lodepng::decode(pixels, width, height, data.data(), data.size());
    if (error) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    if (width > limit || height > limit) {
        return too_large(width, height, max_dimension);
    }

    if (!surf.set_size(static_cast<int>(width), static_cast<int>(height))) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Failed to allocate pixel buffer");
    }

    const std::size_t row_bytes = static_cast<std::size_t>(width) * 4;
    for (unsigned y = 0; y < height; ++y) {
        surf.write_row(static_cast<int>(y), pixels.data() + y * row_bytes);
    }

    return extract_result::success();
}

std::vector<std::uint8_t> encode_png(const pixel_buffer& pixels) {
    if (pixels.width() <= 0 || pixels.height() <= 0) {
        return {};
    }

    const auto w = static_cast<unsigned>(pixels.width());
    const auto h = static_cast<unsigned>(pixels.height());

    // Always RGBA8 so that decoding and re-encoding yields identical bytes
    lodepng::State state;
    state.info_raw.colortype = LCT_RGBA;
    state.info_raw.bitdepth = 8;
    state.info_png.color.colortype = LCT_RGBA;
    state.info_png.color.bitdepth = 8;
    state.encoder.auto_convert = 0;

    std::vector<std::uint8_t> png_data;
    unsigned error = lodepng::encode(png_data, pixels.pixels().data(), w, h, state);
    if (error) {
        return {};
    }

    return png_data;
}

bool write_file(std::span<const std::uint8_t> data, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));

    return file.good();
}

bool save_png(const pixel_buffer& pixels, const std::filesystem::path& path) {
    auto png_data = encode_png(pixels);
    if (png_data.empty()) {
        return false;
    }
    return write_file(png_data, path);
}

} // namespace file_icon
