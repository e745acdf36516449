#include <file_icon/types.hpp>

namespace file_icon {

const char* to_string(extract_error err) noexcept {
    switch (err) {
        case extract_error::none:               return "none";
        case extract_error::not_found:          return "not_found";
        case extract_error::permission_denied:  return "permission_denied";
        case extract_error::bitmap_unavailable: return "bitmap_unavailable";
        case extract_error::encode_error:       return "encode_error";
        case extract_error::invalid_argument:   return "invalid_argument";
    }
    return "unknown";
}

const char* to_string(icon_size size) noexcept {
    switch (size) {
        case icon_size::small:  return "small";
        case icon_size::large:  return "large";
        case icon_size::custom: return "custom";
    }
    return "unknown";
}

} // namespace file_icon
