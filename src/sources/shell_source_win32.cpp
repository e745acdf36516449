#include <file_icon/sources/shell_source.hpp>
#include <file_icon/log.hpp>
#include "../bitmap_helpers.hpp"
#include "../path_text.hpp"
#include "win32_unique.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#include <shobjidl.h>
#include <wrl/client.h>

#include <string>
#include <vector>

namespace file_icon {

namespace {

using Microsoft::WRL::ComPtr;

using unique_hicon = unique_handle<HICON, DestroyIcon>;
using unique_hbitmap = unique_handle<HBITMAP, DeleteObject>;
using unique_hdc = unique_handle<HDC, DeleteDC>;

std::string win32_message(DWORD err) {
    char* buffer = nullptr;
    const DWORD len = FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, err, 0, reinterpret_cast<char*>(&buffer), 0, nullptr);
    std::string message;
    if (len > 0 && buffer) {
        message.assign(buffer, len);
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r' || message.back() == ' ')) {
            message.pop_back();
        }
    } else {
        message = "Win32 error " + std::to_string(err);
    }
    if (buffer) {
        LocalFree(buffer);
    }
    return message;
}

extract_error map_win32_error(DWORD err) {
    switch (err) {
        case ERROR_ACCESS_DENIED:
        case ERROR_PRIVILEGE_NOT_HELD:
            return extract_error::permission_denied;
        default:
            return extract_error::not_found;
    }
}

extract_error map_hresult(HRESULT hr) {
    if (hr == E_ACCESSDENIED || hr == HRESULT_FROM_WIN32(ERROR_ACCESS_DENIED)) {
        return extract_error::permission_denied;
    }
    return extract_error::not_found;
}

// The shell happily returns a generic icon for paths that do not exist,
// so existence and readability are checked up front
extract_result check_access(const std::filesystem::path& path) {
    const std::wstring wpath = path.wstring();
    const DWORD attrs = GetFileAttributesW(wpath.c_str());
    if (attrs == INVALID_FILE_ATTRIBUTES) {
        const DWORD err = GetLastError();
        return extract_result::failure(map_win32_error(err),
            describe(path) + ": " + win32_message(err));
    }

    if (attrs & FILE_ATTRIBUTE_DIRECTORY) {
        return extract_result::success();
    }

    HANDLE file = CreateFileW(wpath.c_str(), GENERIC_READ,
                              FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                              nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file == INVALID_HANDLE_VALUE) {
        const DWORD err = GetLastError();
        // Someone else holding the file open is not a denial
        if (err == ERROR_SHARING_VIOLATION) {
            return extract_result::success();
        }
        return extract_result::failure(map_win32_error(err),
            describe(path) + ": " + win32_message(err));
    }
    CloseHandle(file);
    return extract_result::success();
}

// System image list index of the generic document icon
int generic_icon_index() {
    SHFILEINFOW info{};
    if (!SHGetFileInfoW(L"file", FILE_ATTRIBUTE_NORMAL, &info, sizeof(info),
                        SHGFI_SYSICONINDEX | SHGFI_USEFILEATTRIBUTES)) {
        return -1;
    }
    return info.iIcon;
}

bool read_dib(HDC dc, HBITMAP bitmap, int width, int height, int bits, std::vector<std::uint8_t>& out) {
    // Header plus room for the color table GetDIBits writes for <= 8 bpp
    struct {
        BITMAPINFOHEADER header;
        RGBQUAD colors[256];
    } info{};
    info.header.biSize = sizeof(BITMAPINFOHEADER);
    info.header.biWidth = width;
    info.header.biHeight = height;  // positive: bottom-up rows
    info.header.biPlanes = 1;
    info.header.biBitCount = static_cast<WORD>(bits);
    info.header.biCompression = BI_RGB;

    out.assign(row_stride_4byte(width, bits) * static_cast<std::size_t>(height), 0);
    const int lines = GetDIBits(dc, bitmap, 0, static_cast<UINT>(height), out.data(),
                                reinterpret_cast<BITMAPINFO*>(&info), DIB_RGB_COLORS);
    return lines == height;
}

class hicon_handle : public icon_handle {
public:
    hicon_handle(HICON icon, bool is_default) : icon_(icon), is_default_(is_default) {}

    [[nodiscard]] bool is_default() const noexcept override { return is_default_; }

    [[nodiscard]] extract_result read_bitmap(raw_bitmap& out) const override {
        ICONINFO ii{};
        if (!GetIconInfo(icon_.get(), &ii)) {
            return extract_result::failure(extract_error::bitmap_unavailable,
                "GetIconInfo: " + win32_message(GetLastError()));
        }
        // GetIconInfo hands out copies that the caller owns
        unique_hbitmap color(ii.hbmColor);
        unique_hbitmap mask(ii.hbmMask);
        if (!mask) {
            return extract_result::failure(extract_error::bitmap_unavailable, "Icon has no mask bitmap");
        }

        unique_hdc dc(CreateCompatibleDC(nullptr));
        if (!dc) {
            return extract_result::failure(extract_error::bitmap_unavailable,
                "CreateCompatibleDC: " + win32_message(GetLastError()));
        }

        if (color) {
            BITMAP bm{};
            if (!GetObjectW(color.get(), sizeof(bm), &bm)) {
                return extract_result::failure(extract_error::bitmap_unavailable, "GetObjectW failed on color bitmap");
            }

            // Only 32-bit bitmaps can carry alpha; read everything else as BGR
            const int bits = bm.bmBitsPixel == 32 ? 32 : 24;
            out.width = bm.bmWidth;
            out.height = bm.bmHeight;
            out.bit_count = bits;
            out.top_down = false;
            out.palette.clear();
            if (!read_dib(dc.get(), color.get(), bm.bmWidth, bm.bmHeight, bits, out.color) ||
                !read_dib(dc.get(), mask.get(), bm.bmWidth, bm.bmHeight, 1, out.mask)) {
                return extract_result::failure(extract_error::bitmap_unavailable, "GetDIBits failed");
            }
            return extract_result::success();
        }

        // Monochrome icon: one double-height bitmap, AND half on top, XOR half below
        BITMAP bm{};
        if (!GetObjectW(mask.get(), sizeof(bm), &bm) || bm.bmHeight < 2) {
            return extract_result::failure(extract_error::bitmap_unavailable, "GetObjectW failed on mask bitmap");
        }
        const int width = bm.bmWidth;
        const int height = bm.bmHeight / 2;
        std::vector<std::uint8_t> planes;
        if (!read_dib(dc.get(), mask.get(), width, height * 2, 1, planes)) {
            return extract_result::failure(extract_error::bitmap_unavailable, "GetDIBits failed");
        }

        // Bottom-up rows: the first half in memory is the bottom (XOR) half
        const std::size_t half = row_stride_4byte(width, 1) * static_cast<std::size_t>(height);
        out.width = width;
        out.height = height;
        out.bit_count = 1;
        out.top_down = false;
        out.palette.clear();
        out.color.assign(planes.begin(), planes.begin() + static_cast<std::ptrdiff_t>(half));
        out.mask.assign(planes.begin() + static_cast<std::ptrdiff_t>(half), planes.end());
        return extract_result::success();
    }

private:
    unique_hicon icon_;
    bool is_default_;
};

class hbitmap_handle : public icon_handle {
public:
    explicit hbitmap_handle(HBITMAP bitmap) : bitmap_(bitmap) {}

    [[nodiscard]] extract_result read_bitmap(raw_bitmap& out) const override {
        BITMAP bm{};
        if (!GetObjectW(bitmap_.get(), sizeof(bm), &bm)) {
            return extract_result::failure(extract_error::bitmap_unavailable, "GetObjectW failed on image bitmap");
        }

        unique_hdc dc(CreateCompatibleDC(nullptr));
        if (!dc) {
            return extract_result::failure(extract_error::bitmap_unavailable,
                "CreateCompatibleDC: " + win32_message(GetLastError()));
        }

        out.width = bm.bmWidth;
        out.height = bm.bmHeight;
        out.bit_count = 32;
        out.top_down = false;
        out.palette.clear();
        out.mask.clear();
        if (!read_dib(dc.get(), bitmap_.get(), bm.bmWidth, bm.bmHeight, 32, out.color)) {
            return extract_result::failure(extract_error::bitmap_unavailable, "GetDIBits failed");
        }
        return extract_result::success();
    }

private:
    unique_hbitmap bitmap_;
};

// CoInitializeEx for the duration of one call
class com_scope {
public:
    com_scope() : hr_(CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED | COINIT_DISABLE_OLE1DDE)) {}
    ~com_scope() {
        if (SUCCEEDED(hr_)) {
            CoUninitialize();
        }
    }

    com_scope(const com_scope&) = delete;
    com_scope& operator=(const com_scope&) = delete;

    // RPC_E_CHANGED_MODE: COM is already up on this thread in another model
    [[nodiscard]] bool usable() const noexcept { return SUCCEEDED(hr_) || hr_ == RPC_E_CHANGED_MODE; }
    [[nodiscard]] HRESULT result() const noexcept { return hr_; }

private:
    HRESULT hr_;
};

extract_result open_file_info_icon(const std::filesystem::path& path, icon_size size,
                                   std::unique_ptr<icon_handle>& out) {
    SHFILEINFOW info{};
    const UINT flags = SHGFI_ICON | SHGFI_SYSICONINDEX |
                       (size == icon_size::small ? SHGFI_SMALLICON : SHGFI_LARGEICON);
    if (!SHGetFileInfoW(path.wstring().c_str(), 0, &info, sizeof(info), flags) || !info.hIcon) {
        return extract_result::failure(extract_error::not_found,
            "Shell has no icon for " + describe(path));
    }
    unique_hicon icon(info.hIcon);

    const bool is_default = info.iIcon == generic_icon_index();
    out = std::make_unique<hicon_handle>(icon.release(), is_default);
    return extract_result::success();
}

extract_result open_image_factory_icon(const std::filesystem::path& path, int width, int height,
                                       std::unique_ptr<icon_handle>& out) {
    com_scope com;
    if (!com.usable()) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "CoInitializeEx: " + win32_message(static_cast<DWORD>(com.result())));
    }

    ComPtr<IShellItemImageFactory> factory;
    HRESULT hr = SHCreateItemFromParsingName(path.wstring().c_str(), nullptr, IID_PPV_ARGS(&factory));
    if (FAILED(hr)) {
        return extract_result::failure(map_hresult(hr),
            "SHCreateItemFromParsingName: " + win32_message(static_cast<DWORD>(hr)));
    }

    HBITMAP bitmap = nullptr;
    hr = factory->GetImage(SIZE{width, height},
                           SIIGBF_BIGGERSIZEOK | SIIGBF_RESIZETOFIT | SIIGBF_ICONONLY, &bitmap);
    if (FAILED(hr) || !bitmap) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            "IShellItemImageFactory::GetImage: " + win32_message(static_cast<DWORD>(hr)));
    }

    out = std::make_unique<hbitmap_handle>(bitmap);
    return extract_result::success();
}

} // namespace

extract_result shell_source::open(const std::filesystem::path& path,
                                  const icon_request& request,
                                  std::unique_ptr<icon_handle>& out) const {
    auto result = check_access(path);
    if (!result) return result;

    if (request.size == icon_size::custom) {
        log::debug("shell source: image factory " + std::to_string(request.width) + "x" +
                   std::to_string(request.height) + " for " + describe(path));
        return open_image_factory_icon(path, request.width, request.height, out);
    }
    return open_file_info_icon(path, request.size, out);
}

} // namespace file_icon
