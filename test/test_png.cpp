#include <doctest/doctest.h>
#include <file_icon/file_icon.hpp>

#include "helpers/icon_fixtures.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <vector>

namespace {

file_icon::pixel_buffer gradient(int width, int height) {
    file_icon::pixel_buffer pixels;
    REQUIRE(pixels.set_size(width, height));
    std::vector<std::uint8_t> row(static_cast<std::size_t>(width) * 4);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            std::uint8_t* p = row.data() + static_cast<std::size_t>(x) * 4;
            p[0] = static_cast<std::uint8_t>(x * 16);
            p[1] = static_cast<std::uint8_t>(y * 16);
            p[2] = 0x40;
            p[3] = static_cast<std::uint8_t>((x + y) % 2 ? 0xFF : 0x00);
        }
        pixels.write_row(y, row.data());
    }
    return pixels;
}

} // namespace

// ============================================================================
// PNG Codec Tests
// ============================================================================

TEST_CASE("PNG: sniff") {
    SUBCASE("Signature") {
        std::vector<std::uint8_t> data(std::begin(file_icon::PNG_SIGNATURE), std::end(file_icon::PNG_SIGNATURE));
        CHECK(file_icon::is_png(data));
    }

    SUBCASE("Too short") {
        std::vector<std::uint8_t> data = {0x89, 'P', 'N', 'G'};
        CHECK_FALSE(file_icon::is_png(data));
    }

    SUBCASE("Not confused with ICO") {
        std::vector<std::uint8_t> data = {0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x10, 0x10};
        CHECK_FALSE(file_icon::is_png(data));
    }
}

TEST_CASE("PNG: encode and decode") {
    const auto source = gradient(16, 16);

    const auto png = file_icon::encode_png(source);
    REQUIRE_FALSE(png.empty());
    CHECK(file_icon::is_png(png));

    file_icon::pixel_buffer decoded;
    REQUIRE(file_icon::decode_png(png, decoded).ok);
    CHECK(decoded.width() == 16);
    CHECK(decoded.height() == 16);

    // Fully transparent pixels keep their color channels in RGBA8
    CHECK(std::equal(decoded.pixels().begin(), decoded.pixels().end(), source.pixels().begin()));

    SUBCASE("Re-encoding decoded pixels is byte-stable") {
        CHECK(file_icon::encode_png(decoded) == png);
    }
}

TEST_CASE("PNG: rejects bad input") {
    file_icon::pixel_buffer pixels;

    SUBCASE("Not a PNG") {
        std::vector<std::uint8_t> data(64, 0x42);
        auto result = file_icon::decode_png(data, pixels);
        CHECK_FALSE(result.ok);
        CHECK(result.error == file_icon::extract_error::bitmap_unavailable);
    }

    SUBCASE("Truncated stream") {
        auto png = file_icon::encode_png(gradient(8, 8));
        png.resize(png.size() / 2);
        CHECK(file_icon::decode_png(png, pixels).error == file_icon::extract_error::bitmap_unavailable);
    }

    SUBCASE("Dimensions over the limit") {
        const auto png = file_icon::encode_png(gradient(64, 8));
        CHECK(file_icon::decode_png(png, pixels, 32).error == file_icon::extract_error::bitmap_unavailable);
    }

    SUBCASE("Empty buffer does not encode") {
        CHECK(file_icon::encode_png(file_icon::pixel_buffer{}).empty());
    }
}

TEST_CASE("PNG: save to file") {
    fixtures::temp_dir dir;
    const auto path = dir.path() / "out.png";

    const auto pixels = gradient(4, 4);
    REQUIRE(file_icon::save_png(pixels, path));

    std::ifstream file(path, std::ios::binary);
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    CHECK(data == file_icon::encode_png(pixels));
}
