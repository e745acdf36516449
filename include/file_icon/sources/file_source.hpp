#ifndef FILE_ICON_SOURCES_FILE_SOURCE_HPP_
#define FILE_ICON_SOURCES_FILE_SOURCE_HPP_

#include <file_icon/file_icon_export.h>
#include <file_icon/types.hpp>
#include <file_icon/raw_bitmap.hpp>
#include <file_icon/icon_source.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace file_icon {

// ============================================================================
// Icon Entries
// ============================================================================

/**
 * One image stored in an icon container: an ICO/CUR directory entry or an
 * RT_ICON resource of an executable. `data` is either a DIB (header, color
 * plane, AND mask) or a PNG stream.
 */
struct icon_entry {
    int width = 0;
    int height = 0;
    int bit_count = 0;
    std::vector<std::uint8_t> data;
};

/**
 * Check if data appears to be an ICO or CUR file.
 */
[[nodiscard]] FILE_ICON_EXPORT bool is_ico(std::span<const std::uint8_t> data) noexcept;

/**
 * Check if data is an NE, PE or LX executable that may carry icon resources.
 */
[[nodiscard]] FILE_ICON_EXPORT bool is_executable(std::span<const std::uint8_t> data) noexcept;

/**
 * Collect the images of an ICO/CUR file.
 * Entries that point outside the file are skipped.
 * @return bitmap_unavailable if the header is invalid or no entry is usable
 */
[[nodiscard]] FILE_ICON_EXPORT extract_result read_ico_entries(std::span<const std::uint8_t> data,
                                                               std::vector<icon_entry>& out);

/**
 * Collect the RT_ICON images of an executable.
 * @return not_found if the executable has no icons
 */
[[nodiscard]] FILE_ICON_EXPORT extract_result read_executable_entries(std::span<const std::uint8_t> data,
                                                                      std::vector<icon_entry>& out);

/**
 * Pick the entry that best matches the request: exact size first, then the
 * smallest larger one, then the largest. Ties prefer more bits per pixel.
 * @return Index into entries, or -1 if entries is empty
 */
[[nodiscard]] FILE_ICON_EXPORT int select_entry(std::span<const icon_entry> entries,
                                                const icon_request& request) noexcept;

/**
 * Split an icon image (DIB with AND mask, or PNG) into a raw bitmap.
 */
[[nodiscard]] FILE_ICON_EXPORT extract_result read_icon_image(std::span<const std::uint8_t> data,
                                                              raw_bitmap& out,
                                                              int max_dimension = 1024);

// ============================================================================
// File Source
// ============================================================================

/**
 * Portable icon source that reads icons stored in the file itself:
 * .ico/.cur files and Windows executables (.exe, .dll, .scr, .cpl, ...).
 * Other file types have no icon association here.
 */
class FILE_ICON_EXPORT file_source : public icon_source {
public:
    static constexpr std::string_view source_name = "file";

    [[nodiscard]] std::string_view name() const noexcept override { return source_name; }

    [[nodiscard]] extract_result open(const std::filesystem::path& path,
                                      const icon_request& request,
                                      std::unique_ptr<icon_handle>& out) const override;
};

} // namespace file_icon

#endif // FILE_ICON_SOURCES_FILE_SOURCE_HPP_
