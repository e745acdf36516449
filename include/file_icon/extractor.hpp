#ifndef FILE_ICON_EXTRACTOR_HPP_
#define FILE_ICON_EXTRACTOR_HPP_

#include <file_icon/file_icon_export.h>
#include <file_icon/types.hpp>
#include <file_icon/surface.hpp>
#include <file_icon/icon_source.hpp>
#include <file_icon/metrics.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace file_icon {

// ============================================================================
// Encoded Image
// ============================================================================

struct encoded_image {
    std::vector<std::uint8_t> png;
    std::string text;  // base64 or data URL, empty for output_format::png
    output_format format = output_format::png;
    int width = 0;
    int height = 0;
    bool is_default = false;  // source fell back to its generic icon
};

// Result of an asynchronous extraction
struct extraction {
    extract_result result;
    encoded_image image;
};

// ============================================================================
// Icon Extractor
// ============================================================================

/**
 * Resolves the icon of a path, converts it to RGBA and encodes it as PNG.
 *
 * Stateless between calls: every call acquires its own icon handle and
 * releases it before returning. An extractor may be shared between
 * threads as long as its source and metrics sink are thread-safe.
 */
class FILE_ICON_EXPORT icon_extractor {
public:
    /**
     * Extractor using make_default_source() and no metrics sink.
     */
    icon_extractor();

    /**
     * @param source Icon source, must not be null
     * @param metrics Optional sink receiving one event per call
     */
    explicit icon_extractor(std::shared_ptr<icon_source> source,
                            std::shared_ptr<metrics_sink> metrics = nullptr);

    /**
     * Extract the icon of a path as PNG (and base64 text if requested).
     * @param path File-system path
     * @param options Size class and output format
     * @param out Receives the image on success, untouched on failure
     * @return Result with the error kind on failure
     */
    [[nodiscard]] extract_result extract(const std::filesystem::path& path,
                                         const extract_options& options,
                                         encoded_image& out) const;

    /**
     * Extract the icon of a path as RGBA pixels, without encoding.
     * @param path File-system path
     * @param options Size class; the output format is ignored
     * @param out Receives the pixels on success
     */
    [[nodiscard]] extract_result extract_pixels(const std::filesystem::path& path,
                                                const extract_options& options,
                                                pixel_buffer& out) const;

    /**
     * Run extract() on another thread. Destroying the future without
     * reading it still releases the icon handle.
     */
    [[nodiscard]] std::future<extraction> extract_async(std::filesystem::path path,
                                                        extract_options options) const;

    [[nodiscard]] const icon_source& source() const noexcept { return *source_; }

private:
    extract_result load(const std::filesystem::path& path,
                        const extract_options& options,
                        pixel_buffer& pixels,
                        bool& is_default) const;

    void report(const std::filesystem::path& path,
                const extract_options& options,
                const extract_result& result,
                std::chrono::steady_clock::time_point start) const;

    std::shared_ptr<icon_source> source_;
    std::shared_ptr<metrics_sink> metrics_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/**
 * Extract using a process-wide extractor over make_default_source().
 */
[[nodiscard]] FILE_ICON_EXPORT extract_result extract(const std::filesystem::path& path,
                                                      const extract_options& options,
                                                      encoded_image& out);

/**
 * Validate options before any source is touched.
 * @return invalid_argument for a custom size outside 1..max_dimension
 */
[[nodiscard]] FILE_ICON_EXPORT extract_result validate_options(const extract_options& options);

} // namespace file_icon

#endif // FILE_ICON_EXTRACTOR_HPP_
