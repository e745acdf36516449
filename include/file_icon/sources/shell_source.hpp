#ifndef FILE_ICON_SOURCES_SHELL_SOURCE_HPP_
#define FILE_ICON_SOURCES_SHELL_SOURCE_HPP_

#include <file_icon/file_icon_export.h>
#include <file_icon/icon_source.hpp>

#include <string_view>

#if defined(_WIN32)

namespace file_icon {

// ============================================================================
// Windows Shell Source
// ============================================================================

/**
 * Icon source backed by the Windows shell.
 *
 * - small/large: SHGetFileInfoW, yields an HICON (color + mask bitmaps)
 * - custom: IShellItemImageFactory::GetImage, yields a 32-bit HBITMAP
 *
 * The path is checked with GetFileAttributesW and CreateFileW first so that
 * missing and unreadable files are reported as not_found and
 * permission_denied instead of as the shell's generic icon.
 */
class FILE_ICON_EXPORT shell_source : public icon_source {
public:
    static constexpr std::string_view source_name = "shell";

    [[nodiscard]] std::string_view name() const noexcept override { return source_name; }

    [[nodiscard]] extract_result open(const std::filesystem::path& path,
                                      const icon_request& request,
                                      std::unique_ptr<icon_handle>& out) const override;
};

} // namespace file_icon

#endif // _WIN32

#endif // FILE_ICON_SOURCES_SHELL_SOURCE_HPP_
