#ifndef FILE_ICON_ICON_SOURCE_HPP_
#define FILE_ICON_ICON_SOURCE_HPP_

#include <file_icon/file_icon_export.h>
#include <file_icon/types.hpp>
#include <file_icon/raw_bitmap.hpp>

#include <filesystem>
#include <memory>
#include <string_view>

namespace file_icon {

// ============================================================================
// Icon Handle Interface
// ============================================================================

/**
 * A loaded icon owned by exactly one extraction call.
 *
 * The destructor releases the underlying resource (HICON, HBITMAP, ...).
 * Handles are always held in a std::unique_ptr so that release happens on
 * every exit path, including exceptions and abandoned async calls.
 */
class FILE_ICON_EXPORT icon_handle {
public:
    virtual ~icon_handle() = default;

    icon_handle(const icon_handle&) = delete;
    icon_handle& operator=(const icon_handle&) = delete;

    /**
     * Copy the icon's color and mask planes.
     * @param out Destination bitmap
     * @return bitmap_unavailable if no raster can be realized
     */
    [[nodiscard]] virtual extract_result read_bitmap(raw_bitmap& out) const = 0;

    /**
     * True if the source fell back to its generic "unknown file" icon.
     */
    [[nodiscard]] virtual bool is_default() const noexcept { return false; }

protected:
    icon_handle() = default;
};

// ============================================================================
// Icon Source Interface
// ============================================================================

/**
 * Resolves the icon associated with a file-system path.
 * Sources hold no per-call state and may be shared between threads.
 */
class FILE_ICON_EXPORT icon_source {
public:
    virtual ~icon_source() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * Acquire the icon for a path.
     * @param path File-system path, resolved by the source's own rules
     * @param request Requested size class
     * @param out Receives the handle on success, left empty on failure
     * @return not_found, permission_denied or bitmap_unavailable on failure
     */
    [[nodiscard]] virtual extract_result open(const std::filesystem::path& path,
                                              const icon_request& request,
                                              std::unique_ptr<icon_handle>& out) const = 0;
};

/**
 * The platform's shell source on Windows, the file source elsewhere.
 */
[[nodiscard]] FILE_ICON_EXPORT std::shared_ptr<icon_source> make_default_source();

} // namespace file_icon

#endif // FILE_ICON_ICON_SOURCE_HPP_
