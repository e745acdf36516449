#include <file_icon/sources/file_source.hpp>
#include <file_icon/codecs/png.hpp>
#include <file_icon/log.hpp>
#include "../bitmap_helpers.hpp"
#include "../byte_io.hpp"
#include "../path_text.hpp"

#include <libexe/libexe.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <limits>
#include <memory>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

namespace file_icon {

namespace {

namespace fs = std::filesystem;

// ICO/CUR file header
struct ico_header {
    std::uint16_t reserved;   // Must be 0
    std::uint16_t type;       // 1 = ICO, 2 = CUR
    std::uint16_t count;      // Number of images
};

// ICO directory entry
struct ico_dir_entry {
    std::uint8_t width;       // Width (0 = 256)
    std::uint8_t height;      // Height (0 = 256)
    std::uint8_t color_count; // Colors (0 if >= 8bpp)
    std::uint8_t reserved;
    std::uint16_t planes;     // Color planes (ICO) or hotspot X (CUR)
    std::uint16_t bit_count;  // Bits per pixel (ICO) or hotspot Y (CUR)
    std::uint32_t size;       // Image data size
    std::uint32_t offset;     // Image data offset in file
};

// BITMAPINFOHEADER
struct dib_header {
    std::uint32_t size;
    std::int32_t width;
    std::int32_t height;      // Doubled for icons (includes AND mask)
    std::uint16_t planes;
    std::uint16_t bit_count;
    std::uint32_t compression;
    std::uint32_t clr_used;
};

constexpr std::size_t ICO_HEADER_SIZE = 6;
constexpr std::size_t ICO_DIR_ENTRY_SIZE = 16;
constexpr std::size_t DIB_HEADER_SIZE = 40;
constexpr std::uint32_t BI_RGB = 0;

bool parse_ico_header(std::span<const std::uint8_t> data, ico_header& header) {
    if (data.size() < ICO_HEADER_SIZE) return false;
    header.reserved = read_le16(data.data());
    header.type = read_le16(data.data() + 2);
    header.count = read_le16(data.data() + 4);
    return header.reserved == 0 && (header.type == 1 || header.type == 2);
}

void parse_ico_dir_entry(const std::uint8_t* p, ico_dir_entry& entry) {
    entry.width = p[0];
    entry.height = p[1];
    entry.color_count = p[2];
    entry.reserved = p[3];
    entry.planes = read_le16(p + 4);
    entry.bit_count = read_le16(p + 6);
    entry.size = read_le32(p + 8);
    entry.offset = read_le32(p + 12);
}

bool parse_dib_header(std::span<const std::uint8_t> data, dib_header& header) {
    if (data.size() < DIB_HEADER_SIZE) return false;
    const std::uint8_t* p = data.data();
    header.size = read_le32(p);
    if (header.size < DIB_HEADER_SIZE) return false;
    header.width = read_le32_signed(p + 4);
    header.height = read_le32_signed(p + 8);
    // Negating INT32_MIN overflows; no real icon is that tall
    if (header.height == std::numeric_limits<std::int32_t>::min()) return false;
    header.planes = read_le16(p + 12);
    header.bit_count = read_le16(p + 14);
    header.compression = read_le32(p + 16);
    header.clr_used = read_le32(p + 32);
    return true;
}

// Fill in the real dimensions of an entry from its payload; directory
// bytes are only hints and are wrong in the wild often enough
bool measure_entry(icon_entry& entry) {
    const std::span<const std::uint8_t> data(entry.data);
    if (is_png(data)) {
        if (data.size() < 24) return false;
        entry.width = static_cast<int>(read_be32(data.data() + 16));
        entry.height = static_cast<int>(read_be32(data.data() + 20));
        entry.bit_count = 32;
        return entry.width > 0 && entry.height > 0;
    }

    dib_header header;
    if (!parse_dib_header(data, header)) return false;
    entry.width = header.width;
    entry.height = std::abs(header.height) / 2;
    entry.bit_count = header.bit_count;
    return entry.width > 0 && entry.height > 0;
}

extract_result read_png_image(std::span<const std::uint8_t> data, raw_bitmap& out, int max_dimension) {
    pixel_buffer pixels;
    auto result = decode_png(data, pixels, max_dimension);
    if (!result) return result;

    out.width = pixels.width();
    out.height = pixels.height();
    out.bit_count = 32;
    out.top_down = true;
    out.palette.clear();
    out.mask.clear();
    out.color.assign(pixels.pixels().begin(), pixels.pixels().end());

    // RGBA to BGRA
    for (std::size_t i = 0; i + 3 < out.color.size(); i += 4) {
        std::swap(out.color[i], out.color[i + 2]);
    }
    return extract_result::success();
}

extract_result read_dib_image(std::span<const std::uint8_t> data, raw_bitmap& out, int max_dimension) {
    dib_header header;
    if (!parse_dib_header(data, header)) {
        return extract_result::failure(extract_error::bitmap_unavailable, "Invalid DIB header");
    }

    // Only uncompressed DIBs appear in icons
    if (header.compression != BI_RGB) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Compressed icon DIB is not supported");
    }

    if (!is_valid_bit_count(header.bit_count)) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Unsupported bit depth: " + std::to_string(header.bit_count));
    }

    // Icon height is doubled (XOR + AND planes), must be even and positive
    const std::int32_t abs_height = std::abs(header.height);
    if (abs_height < 2 || (abs_height % 2) != 0) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Icon DIB height is not doubled");
    }

    const int width = header.width;
    const int height = abs_height / 2;
    if (width <= 0 || width > max_dimension || height > max_dimension) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "Icon DIB dimensions out of range");
    }

    const std::size_t xor_stride = row_stride_4byte(width, header.bit_count);
    const std::size_t and_stride = row_stride_4byte(width, 1);
    const std::size_t xor_size = xor_stride * static_cast<std::size_t>(height);
    std::size_t and_size = and_stride * static_cast<std::size_t>(height);

    std::uint32_t max_palette_colors = 0;
    if (header.bit_count <= 8) {
        max_palette_colors = 1u << header.bit_count;
    }
    // biClrUsed also sizes the optional color table of 16/24/32-bit DIBs,
    // which sits before the pixels but is not a palette
    std::uint32_t palette_colors = header.clr_used;
    if (palette_colors == 0) {
        palette_colors = max_palette_colors;
    } else if (max_palette_colors > 0 && palette_colors > max_palette_colors) {
        palette_colors = max_palette_colors;
    }
    if (palette_colors > data.size() / 4) {
        return extract_result::failure(extract_error::bitmap_unavailable, "Truncated DIB color table");
    }

    if (header.size > data.size()) {
        return extract_result::failure(extract_error::bitmap_unavailable, "Truncated DIB header");
    }

    const std::size_t palette_size = static_cast<std::size_t>(palette_colors) * 4;
    const std::size_t header_and_palette = static_cast<std::size_t>(header.size) + palette_size;

    if (header_and_palette > data.size() || xor_size > data.size() - header_and_palette) {
        return extract_result::failure(extract_error::bitmap_unavailable, "Truncated icon color plane");
    }
    // Some writers drop the AND mask of 32-bit images
    if (and_size > data.size() - header_and_palette - xor_size) {
        and_size = 0;
    }

    const std::uint8_t* palette_ptr = data.data() + header.size;
    const std::uint8_t* xor_data = data.data() + header_and_palette;
    const std::uint8_t* and_data = xor_data + xor_size;

    out.width = width;
    out.height = height;
    out.bit_count = header.bit_count;
    out.top_down = header.height < 0;
    if (max_palette_colors > 0) {
        out.palette.assign(palette_ptr, palette_ptr + palette_size);
    } else {
        out.palette.clear();
    }
    out.color.assign(xor_data, xor_data + xor_size);
    out.mask.assign(and_data, and_data + and_size);

    return extract_result::success();
}

// Reads a whole file; errno tells missing from forbidden
extract_result read_file(const fs::path& path, std::vector<std::uint8_t>& out) {
    std::unique_ptr<std::FILE, int (*)(std::FILE*)> file(
        std::fopen(path.string().c_str(), "rb"), &std::fclose);
    if (!file) {
        const int err = errno;
        if (err == EACCES || err == EPERM) {
            return extract_result::failure(extract_error::permission_denied,
                "Cannot read " + describe(path) + ": " + std::generic_category().message(err));
        }
        return extract_result::failure(extract_error::not_found,
            "Cannot open " + describe(path) + ": " + std::generic_category().message(err));
    }

    std::uint8_t buffer[64 * 1024];
    std::size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file.get())) > 0) {
        out.insert(out.end(), buffer, buffer + n);
    }
    if (std::ferror(file.get())) {
        const int err = errno;
        if (err == EACCES || err == EPERM) {
            return extract_result::failure(extract_error::permission_denied,
                "Cannot read " + describe(path));
        }
        return extract_result::failure(extract_error::bitmap_unavailable,
            "I/O error reading " + describe(path));
    }
    return extract_result::success();
}

class entry_handle : public icon_handle {
public:
    entry_handle(icon_entry entry, int max_dimension)
        : entry_(std::move(entry)), max_dimension_(max_dimension) {}

    [[nodiscard]] extract_result read_bitmap(raw_bitmap& out) const override {
        return read_icon_image(entry_.data, out, max_dimension_);
    }

private:
    icon_entry entry_;
    int max_dimension_;
};

} // namespace

// ============================================================================
// Container Parsing
// ============================================================================

bool is_ico(std::span<const std::uint8_t> data) noexcept {
    ico_header header;
    return parse_ico_header(data, header) && header.count > 0;
}

bool is_executable(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 64) return false;

    if (data[0] != 'M' || data[1] != 'Z') return false;

    try {
        auto format = libexe::executable_factory::detect_format(data);
        return format == libexe::format_type::NE_WIN16 ||
               format == libexe::format_type::PE_WIN32 ||
               format == libexe::format_type::PE_PLUS_WIN64 ||
               format == libexe::format_type::LX_OS2_BOUND ||
               format == libexe::format_type::LX_OS2_RAW;
    } catch (const std::exception&) {
        return false;
    }
}

extract_result read_ico_entries(std::span<const std::uint8_t> data, std::vector<icon_entry>& out) {
    ico_header header;
    if (!parse_ico_header(data, header)) {
        return extract_result::failure(extract_error::bitmap_unavailable, "Invalid ICO header");
    }
    if (header.count == 0) {
        return extract_result::failure(extract_error::bitmap_unavailable, "ICO file has no images");
    }

    std::size_t dir_offset = ICO_HEADER_SIZE;
    for (int i = 0; i < header.count; ++i) {
        if (dir_offset + ICO_DIR_ENTRY_SIZE > data.size()) break;

        ico_dir_entry dir;
        parse_ico_dir_entry(data.data() + dir_offset, dir);
        dir_offset += ICO_DIR_ENTRY_SIZE;

        if (dir.size == 0 || dir.offset >= data.size() || dir.size > data.size() - dir.offset) {
            continue;
        }

        icon_entry entry;
        const auto payload = data.subspan(dir.offset, dir.size);
        entry.data.assign(payload.begin(), payload.end());
        if (measure_entry(entry)) {
            out.push_back(std::move(entry));
        }
    }

    if (out.empty()) {
        return extract_result::failure(extract_error::bitmap_unavailable, "No valid icon entries");
    }
    return extract_result::success();
}

extract_result read_executable_entries(std::span<const std::uint8_t> data, std::vector<icon_entry>& out) {
    auto add_entry = [&out](const auto& bytes) {
        icon_entry entry;
        entry.data.assign(bytes.begin(), bytes.end());
        if (measure_entry(entry)) {
            out.push_back(std::move(entry));
        }
    };

    try {
        auto exe = libexe::executable_factory::from_memory(data);

        std::visit([&add_entry](auto& file) {
            using T = std::decay_t<decltype(file)>;

            if constexpr (std::is_same_v<T, libexe::ne_file> || std::is_same_v<T, libexe::pe_file>) {
                auto resources = file.resources();
                if (!resources) return;

                auto icon_resources = resources->resources_by_type(libexe::resource_type::RT_ICON);
                for (std::size_t i = 0; i < icon_resources.size(); ++i) {
                    auto icon_res = icon_resources.at(i);
                    if (!icon_res) continue;

                    auto icon_image = icon_res->as_icon();
                    if (!icon_image) continue;

                    add_entry(icon_image->raw_dib_data());
                }
            } else if constexpr (std::is_same_v<T, libexe::le_file>) {
                // OS/2 keeps icons as RT_POINTER resources
                if (!file.has_resources()) return;

                for (const auto& res : file.resources_by_type(libexe::le_resource::RT_POINTER)) {
                    auto res_data = file.read_resource_data(res);
                    if (res_data.empty()) continue;
                    add_entry(res_data);
                }
            }
        }, exe);
    } catch (const std::exception& e) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            std::string("Malformed executable: ") + e.what());
    }

    if (out.empty()) {
        return extract_result::failure(extract_error::not_found, "No icons in executable");
    }
    return extract_result::success();
}

int select_entry(std::span<const icon_entry> entries, const icon_request& request) noexcept {
    if (entries.empty()) {
        return -1;
    }

    const int target = request.size == icon_size::custom
        ? std::max(request.width, request.height)
        : nominal_dimension(request.size);

    auto edge = [](const icon_entry& e) { return std::max(e.width, e.height); };

    // Rank: 0 = exact, 1 = larger (closer is better), 2 = smaller (larger is better)
    auto better = [&](const icon_entry& a, const icon_entry& b) {
        const int ea = edge(a);
        const int eb = edge(b);
        const int ra = ea == target ? 0 : (ea > target ? 1 : 2);
        const int rb = eb == target ? 0 : (eb > target ? 1 : 2);
        if (ra != rb) return ra < rb;
        if (ra == 1 && ea != eb) return ea < eb;
        if (ra == 2 && ea != eb) return ea > eb;
        return a.bit_count > b.bit_count;
    };

    std::size_t best = 0;
    for (std::size_t i = 1; i < entries.size(); ++i) {
        if (better(entries[i], entries[best])) {
            best = i;
        }
    }
    return static_cast<int>(best);
}

extract_result read_icon_image(std::span<const std::uint8_t> data, raw_bitmap& out, int max_dimension) {
    if (data.size() < 8) {
        return extract_result::failure(extract_error::bitmap_unavailable, "Icon image is truncated");
    }
    if (is_png(data)) {
        return read_png_image(data, out, max_dimension);
    }
    return read_dib_image(data, out, max_dimension);
}

// ============================================================================
// File Source
// ============================================================================

extract_result file_source::open(const fs::path& path,
                                 const icon_request& request,
                                 std::unique_ptr<icon_handle>& out) const {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        if (ec == std::errc::permission_denied) {
            return extract_result::failure(extract_error::permission_denied,
                "Cannot access " + describe(path) + ": " + ec.message());
        }
        return extract_result::failure(extract_error::not_found,
            "Cannot access " + describe(path) + ": " + ec.message());
    }
    if (!fs::exists(status)) {
        return extract_result::failure(extract_error::not_found, "No such file: " + describe(path));
    }
    if (!fs::is_regular_file(status)) {
        return extract_result::failure(extract_error::not_found,
            "No icon association for " + describe(path));
    }

    std::vector<std::uint8_t> data;
    auto result = read_file(path, data);
    if (!result) return result;

    std::vector<icon_entry> entries;
    if (is_ico(data)) {
        result = read_ico_entries(data, entries);
    } else if (is_executable(data)) {
        result = read_executable_entries(data, entries);
    } else {
        return extract_result::failure(extract_error::not_found,
            "No icon association for " + describe(path));
    }
    if (!result) return result;

    const int index = select_entry(entries, request);
    if (index < 0) {
        return extract_result::failure(extract_error::not_found, "No icon in " + describe(path));
    }

    auto& chosen = entries[static_cast<std::size_t>(index)];
    if (log::enabled(log::level::debug)) {
        log::debug("file source picked " + std::to_string(chosen.width) + "x" +
                   std::to_string(chosen.height) + "@" + std::to_string(chosen.bit_count) +
                   " of " + std::to_string(entries.size()) + " entries in " + describe(path));
    }

    out = std::make_unique<entry_handle>(std::move(chosen), request.max_dimension);
    return extract_result::success();
}

} // namespace file_icon
