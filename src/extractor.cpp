#include <file_icon/extractor.hpp>
#include <file_icon/raw_bitmap.hpp>
#include <file_icon/codecs/png.hpp>
#include <file_icon/base64.hpp>
#include <file_icon/log.hpp>
#include "path_text.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace file_icon {

namespace {

icon_request make_request(const extract_options& options) {
    icon_request request;
    request.size = options.size;
    if (options.size == icon_size::custom) {
        request.width = options.width;
        request.height = options.height;
    } else {
        request.width = nominal_dimension(options.size);
        request.height = request.width;
    }
    request.max_dimension = options.max_dimension;
    return request;
}

} // namespace

extract_result validate_options(const extract_options& options) {
    if (options.max_dimension <= 0) {
        return extract_result::failure(extract_error::invalid_argument,
            "max_dimension must be positive");
    }
    if (options.size == icon_size::custom) {
        if (options.width <= 0 || options.height <= 0 ||
            options.width > options.max_dimension || options.height > options.max_dimension) {
            return extract_result::failure(extract_error::invalid_argument,
                "Custom icon size " + std::to_string(options.width) + "x" +
                std::to_string(options.height) + " outside 1.." +
                std::to_string(options.max_dimension));
        }
    }
    return extract_result::success();
}

// ============================================================================
// Icon Extractor
// ============================================================================

icon_extractor::icon_extractor()
    : icon_extractor(make_default_source()) {}

icon_extractor::icon_extractor(std::shared_ptr<icon_source> source,
                               std::shared_ptr<metrics_sink> metrics)
    : source_(std::move(source)), metrics_(std::move(metrics)) {
    if (!source_) {
        throw std::invalid_argument("icon_extractor: source must not be null");
    }
}

extract_result icon_extractor::load(const std::filesystem::path& path,
                                    const extract_options& options,
                                    pixel_buffer& pixels,
                                    bool& is_default) const {
    auto result = validate_options(options);
    if (!result) return result;

    if (path.empty()) {
        return extract_result::failure(extract_error::invalid_argument, "Empty path");
    }

    raw_bitmap bitmap;
    try {
        std::unique_ptr<icon_handle> handle;
        result = source_->open(path, make_request(options), handle);
        if (!result) return result;
        if (!handle) {
            return extract_result::failure(extract_error::bitmap_unavailable,
                std::string(source_->name()) + " source returned no handle");
        }

        result = handle->read_bitmap(bitmap);
        if (!result) return result;
        is_default = handle->is_default();
        // handle released here, before conversion and encoding
    } catch (const std::exception& e) {
        return extract_result::failure(extract_error::bitmap_unavailable,
            std::string(source_->name()) + " source failed: " + e.what());
    }

    return convert_bitmap(bitmap, pixels, options.max_dimension);
}

void icon_extractor::report(const std::filesystem::path& path,
                            const extract_options& options,
                            const extract_result& result,
                            std::chrono::steady_clock::time_point start) const {
    const auto latency = std::chrono::steady_clock::now() - start;

    if (metrics_) {
        extract_event event;
        event.path = &path;
        event.size = options.size;
        event.outcome = result.ok ? extract_error::none : result.error;
        event.latency = std::chrono::duration_cast<std::chrono::nanoseconds>(latency);
        metrics_->record(event);
    }

    if (result.ok) {
        if (log::enabled(log::level::debug)) {
            const auto us = std::chrono::duration_cast<std::chrono::microseconds>(latency).count();
            log::debug("extracted " + std::string(to_string(options.size)) + " icon of " +
                       describe(path) + " in " + std::to_string(us) + "us");
        }
        return;
    }

    const std::string line = std::string(to_string(result.error)) + ": " + describe(path) +
                             (result.message.empty() ? std::string() : ": " + result.message);
    if (result.error == extract_error::encode_error) {
        log::error(line);
    } else {
        log::warn(line);
    }
}

extract_result icon_extractor::extract(const std::filesystem::path& path,
                                       const extract_options& options,
                                       encoded_image& out) const {
    const auto start = std::chrono::steady_clock::now();

    pixel_buffer pixels;
    bool is_default = false;
    auto result = load(path, options, pixels, is_default);

    if (result) {
        encoded_image image;
        image.png = encode_png(pixels);
        if (image.png.empty()) {
            result = extract_result::failure(extract_error::encode_error,
                "PNG encoder rejected " + std::to_string(pixels.width()) + "x" +
                std::to_string(pixels.height()) + " buffer");
        } else {
            image.format = options.format;
            image.width = pixels.width();
            image.height = pixels.height();
            image.is_default = is_default;
            switch (options.format) {
                case output_format::png:
                    break;
                case output_format::base64:
                    image.text = encode_base64(image.png);
                    break;
                case output_format::data_url:
                    image.text = to_png_data_url(image.png);
                    break;
            }
            out = std::move(image);
        }
    }

    report(path, options, result, start);
    return result;
}

extract_result icon_extractor::extract_pixels(const std::filesystem::path& path,
                                              const extract_options& options,
                                              pixel_buffer& out) const {
    const auto start = std::chrono::steady_clock::now();

    pixel_buffer pixels;
    bool is_default = false;
    auto result = load(path, options, pixels, is_default);
    if (result) {
        out = std::move(pixels);
    }

    report(path, options, result, start);
    return result;
}

std::future<extraction> icon_extractor::extract_async(std::filesystem::path path,
                                                      extract_options options) const {
    // Copies share the source and sink; nothing in *this is referenced later
    return std::async(std::launch::async,
        [self = *this, path = std::move(path), options]() {
            extraction x;
            x.result = self.extract(path, options, x.image);
            return x;
        });
}

// ============================================================================
// Convenience Functions
// ============================================================================

extract_result extract(const std::filesystem::path& path,
                       const extract_options& options,
                       encoded_image& out) {
    static const icon_extractor extractor;
    return extractor.extract(path, options, out);
}

} // namespace file_icon
