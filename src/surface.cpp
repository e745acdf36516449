#include <file_icon/surface.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>

namespace file_icon {

bool pixel_buffer::set_size(int width, int height) {
    if (width <= 0 || height <= 0) {
        return false;
    }

    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);

    // Check for overflow in pitch calculation (width * 4)
    if (w > std::numeric_limits<std::size_t>::max() / 4) {
        return false;
    }
    const std::size_t pitch = w * 4;

    if (pitch > std::numeric_limits<std::size_t>::max() / h) {
        return false;
    }
    const std::size_t total_size = pitch * h;

    // Icons never come close to this; anything larger is a broken source
    constexpr std::size_t MAX_BUFFER_SIZE = 256ULL * 1024ULL * 1024ULL;
    if (total_size > MAX_BUFFER_SIZE) {
        return false;
    }

    try {
        pixels_.assign(total_size, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    return true;
}

void pixel_buffer::write_row(int y, const std::uint8_t* pixels) {
    if (y < 0 || y >= height_ || !pixels) {
        return;
    }
    std::memcpy(pixels_.data() + static_cast<std::size_t>(y) * pitch(), pixels, pitch());
}

std::size_t pixel_buffer::count_opaque() const noexcept {
    std::size_t count = 0;
    for (std::size_t i = 3; i < pixels_.size(); i += 4) {
        if (pixels_[i] != 0) {
            ++count;
        }
    }
    return count;
}

} // namespace file_icon
