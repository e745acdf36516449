#include <file_icon/base64.hpp>

#include <array>

namespace file_icon {

namespace {

constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::uint8_t INVALID = 0xFF;

constexpr std::array<std::uint8_t, 256> make_decode_table() {
    std::array<std::uint8_t, 256> table{};
    for (auto& v : table) {
        v = INVALID;
    }
    for (std::uint8_t i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] = i;
    }
    return table;
}

constexpr auto DECODE_TABLE = make_decode_table();

} // namespace

std::string encode_base64(std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        const std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(ALPHABET[(n >> 6) & 0x3F]);
        out.push_back(ALPHABET[n & 0x3F]);
    }

    const std::size_t rest = data.size() - i;
    if (rest == 1) {
        const std::uint32_t n = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        const std::uint32_t n = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(ALPHABET[(n >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

std::optional<std::vector<std::uint8_t>> decode_base64(std::string_view text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    for (std::size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        std::size_t padding = 0;
        if (last) {
            if (text[i + 3] == '=') ++padding;
            if (text[i + 2] == '=') ++padding;
            // "x=y=" style padding is malformed
            if (padding == 1 && text[i + 2] == '=') return std::nullopt;
        }

        std::uint32_t n = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            std::uint8_t v = 0;
            if (j < 4 - padding) {
                v = DECODE_TABLE[static_cast<unsigned char>(text[i + j])];
                if (v == INVALID) {
                    return std::nullopt;
                }
            }
            n = (n << 6) | v;
        }

        out.push_back(static_cast<std::uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<std::uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<std::uint8_t>(n & 0xFF));
    }

    return out;
}

std::string to_png_data_url(std::span<const std::uint8_t> png) {
    std::string url(PNG_DATA_URL_PREFIX);
    url += encode_base64(png);
    return url;
}

} // namespace file_icon
