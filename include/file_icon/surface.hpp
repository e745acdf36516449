#ifndef FILE_ICON_SURFACE_HPP_
#define FILE_ICON_SURFACE_HPP_

#include <file_icon/file_icon_export.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace file_icon {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract destination for RGBA pixels.
 * The bitmap converter and the PNG decoder write rows to a surface, so a
 * caller can receive pixels directly in its own framework's buffer.
 */
class FILE_ICON_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Set the surface dimensions. Always RGBA, 4 bytes per pixel.
     * Called before any pixel writes.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height) = 0;

    /**
     * Write one full row of RGBA pixels.
     * @param y Row number, 0 is the top row
     * @param pixels width * 4 bytes
     */
    virtual void write_row(int y, const std::uint8_t* pixels) = 0;
};

// ============================================================================
// Pixel Buffer (default implementation)
// ============================================================================

/**
 * In-memory RGBA surface: width x height row-major RGBA quadruplets.
 */
class FILE_ICON_EXPORT pixel_buffer : public surface {
public:
    pixel_buffer() = default;
    ~pixel_buffer() override = default;

    pixel_buffer(const pixel_buffer&) = default;
    pixel_buffer& operator=(const pixel_buffer&) = default;
    pixel_buffer(pixel_buffer&&) noexcept = default;
    pixel_buffer& operator=(pixel_buffer&&) noexcept = default;

    // Surface interface
    bool set_size(int width, int height) override;
    void write_row(int y, const std::uint8_t* pixels) override;

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
    [[nodiscard]] std::size_t pitch() const noexcept { return static_cast<std::size_t>(width_) * 4; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<std::uint8_t> mutable_pixels() noexcept { return pixels_; }

    // Pointer to the RGBA quadruplet at (x, y); no bounds check.
    [[nodiscard]] const std::uint8_t* at(int x, int y) const noexcept {
        return pixels_.data() + static_cast<std::size_t>(y) * pitch() + static_cast<std::size_t>(x) * 4;
    }

    // Number of pixels with non-zero alpha
    [[nodiscard]] std::size_t count_opaque() const noexcept;

private:
    std::vector<std::uint8_t> pixels_;
    int width_ = 0;
    int height_ = 0;
};

} // namespace file_icon

#endif // FILE_ICON_SURFACE_HPP_
