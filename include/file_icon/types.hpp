#ifndef FILE_ICON_TYPES_HPP_
#define FILE_ICON_TYPES_HPP_

#include <file_icon/file_icon_export.h>

#include <cstdint>
#include <string>

namespace file_icon {

// ============================================================================
// Size Classes
// ============================================================================

enum class icon_size {
    small,   // Shell small icon (16x16 on default DPI)
    large,   // Shell large icon (32x32 on default DPI)
    custom   // Caller-provided width/height, best effort
};

[[nodiscard]] FILE_ICON_EXPORT const char* to_string(icon_size size) noexcept;

// Nominal pixel size used by sources that have no system metric to ask.
[[nodiscard]] constexpr int nominal_dimension(icon_size size) noexcept {
    switch (size) {
        case icon_size::small:  return 16;
        case icon_size::large:  return 32;
        case icon_size::custom: return 0;
    }
    return 0;
}

// ============================================================================
// Output Formats
// ============================================================================

enum class output_format {
    png,       // PNG bytes only
    base64,    // PNG bytes plus standard base64 text
    data_url   // PNG bytes plus "data:image/png;base64,..." text
};

// ============================================================================
// Extract Errors
// ============================================================================

enum class extract_error {
    none,
    not_found,
    permission_denied,
    bitmap_unavailable,
    encode_error,
    invalid_argument
};

[[nodiscard]] FILE_ICON_EXPORT const char* to_string(extract_error err) noexcept;

// ============================================================================
// Extract Result
// ============================================================================

struct extract_result {
    bool ok = false;
    extract_error error = extract_error::none;
    std::string message;

    [[nodiscard]] static extract_result success() {
        return {true, extract_error::none, {}};
    }

    [[nodiscard]] static extract_result failure(extract_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Extract Options
// ============================================================================

struct extract_options {
    icon_size size = icon_size::large;

    // Requested dimensions, only read when size == icon_size::custom
    int width = 0;
    int height = 0;

    output_format format = output_format::png;

    // Largest bitmap edge accepted from a source
    int max_dimension = 1024;
};

// What a source is asked for. Derived from extract_options.
struct icon_request {
    icon_size size = icon_size::large;
    int width = 0;
    int height = 0;
    int max_dimension = 1024;
};

} // namespace file_icon

#endif // FILE_ICON_TYPES_HPP_
