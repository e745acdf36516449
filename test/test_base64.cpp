#include <doctest/doctest.h>
#include <file_icon/file_icon.hpp>

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::vector<std::uint8_t> bytes(std::string_view text) {
    return {text.begin(), text.end()};
}

} // namespace

// ============================================================================
// Base64 Tests
// ============================================================================

TEST_CASE("base64: RFC 4648 vectors") {
    CHECK(file_icon::encode_base64(bytes("")) == "");
    CHECK(file_icon::encode_base64(bytes("f")) == "Zg==");
    CHECK(file_icon::encode_base64(bytes("fo")) == "Zm8=");
    CHECK(file_icon::encode_base64(bytes("foo")) == "Zm9v");
    CHECK(file_icon::encode_base64(bytes("foob")) == "Zm9vYg==");
    CHECK(file_icon::encode_base64(bytes("fooba")) == "Zm9vYmE=");
    CHECK(file_icon::encode_base64(bytes("foobar")) == "Zm9vYmFy");
}

TEST_CASE("base64: decode") {
    SUBCASE("Valid text") {
        auto decoded = file_icon::decode_base64("Zm9vYmE=");
        REQUIRE(decoded.has_value());
        CHECK(*decoded == bytes("fooba"));
    }

    SUBCASE("PNG signature survives") {
        const std::vector<std::uint8_t> sig(std::begin(file_icon::PNG_SIGNATURE), std::end(file_icon::PNG_SIGNATURE));
        const auto text = file_icon::encode_base64(sig);
        CHECK(text == "iVBORw0KGgo=");
        auto decoded = file_icon::decode_base64(text);
        REQUIRE(decoded.has_value());
        CHECK(*decoded == sig);
    }

    SUBCASE("Bytes above 0x7F") {
        const std::vector<std::uint8_t> data = {0xFF, 0xFE, 0xFD, 0x00, 0x80};
        auto decoded = file_icon::decode_base64(file_icon::encode_base64(data));
        REQUIRE(decoded.has_value());
        CHECK(*decoded == data);
    }
}

TEST_CASE("base64: rejects malformed text") {
    CHECK_FALSE(file_icon::decode_base64("Zm9").has_value());       // length
    CHECK_FALSE(file_icon::decode_base64("Zm9v\n").has_value());     // whitespace
    CHECK_FALSE(file_icon::decode_base64("Zm-v").has_value());       // url alphabet
    CHECK_FALSE(file_icon::decode_base64("Zg==Zm9v").has_value());   // padding mid-stream
    CHECK_FALSE(file_icon::decode_base64("Zm=v").has_value());       // misplaced padding
}

TEST_CASE("base64: PNG data URL") {
    const std::vector<std::uint8_t> data = {'a', 'b', 'c'};
    const auto url = file_icon::to_png_data_url(data);
    CHECK(url == "data:image/png;base64,YWJj");
    CHECK(url.rfind(file_icon::PNG_DATA_URL_PREFIX, 0) == 0);
}
