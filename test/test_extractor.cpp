#include <doctest/doctest.h>
#include <file_icon/file_icon.hpp>

#include "helpers/icon_fixtures.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using fixtures::counted_source;
using fixtures::fake_behavior;

namespace {

file_icon::extract_options with_format(file_icon::output_format format) {
    file_icon::extract_options options;
    options.format = format;
    return options;
}

} // namespace

// ============================================================================
// Handle Lifetime
// ============================================================================

TEST_CASE("Extractor: every acquired handle is released") {
    struct outcome {
        fake_behavior behavior;
        file_icon::extract_error expected;
        int acquisitions;
    };
    const outcome outcomes[] = {
        {fake_behavior::succeed, file_icon::extract_error::none, 1},
        {fake_behavior::not_found, file_icon::extract_error::not_found, 0},
        {fake_behavior::permission_denied, file_icon::extract_error::permission_denied, 0},
        {fake_behavior::bitmap_unavailable, file_icon::extract_error::bitmap_unavailable, 1},
        {fake_behavior::throw_on_read, file_icon::extract_error::bitmap_unavailable, 1},
        {fake_behavior::malformed_bitmap, file_icon::extract_error::bitmap_unavailable, 1},
    };

    for (const auto& o : outcomes) {
        INFO("expected outcome: ", file_icon::to_string(o.expected));

        auto source = std::make_shared<counted_source>(fixtures::alpha_icon(32), o.behavior);
        file_icon::icon_extractor extractor(source);

        file_icon::encoded_image image;
        auto result = extractor.extract("C:\\icons\\app.exe", {}, image);

        CHECK(result.ok == (o.expected == file_icon::extract_error::none));
        CHECK(result.error == o.expected);
        CHECK(source->counters->acquired.load() == o.acquisitions);
        CHECK(source->counters->released.load() == source->counters->acquired.load());
    }
}

TEST_CASE("Extractor: repeated calls do not accumulate handles") {
    auto source = std::make_shared<counted_source>(fixtures::mask_icon(16));
    file_icon::icon_extractor extractor(source);

    for (int i = 0; i < 50; ++i) {
        file_icon::encoded_image image;
        REQUIRE(extractor.extract("/tmp/file.txt", with_format(file_icon::output_format::base64), image).ok);
    }
    CHECK(source->counters->acquired.load() == 50);
    CHECK(source->counters->released.load() == 50);
}

TEST_CASE("Extractor: async calls") {
    auto source = std::make_shared<counted_source>(fixtures::alpha_icon(32));
    file_icon::icon_extractor extractor(source);

    SUBCASE("Result is delivered") {
        auto future = extractor.extract_async("/tmp/a.png", with_format(file_icon::output_format::base64));
        auto x = future.get();
        REQUIRE(x.result.ok);
        CHECK(x.image.width == 32);
        CHECK_FALSE(x.image.text.empty());
    }

    SUBCASE("Abandoned futures still release") {
        {
            auto first = extractor.extract_async("/tmp/a.png", {});
            auto second = extractor.extract_async("/tmp/b.png", {});
            // futures from std::async join on destruction
        }
        CHECK(source->counters->acquired.load() == 2);
        CHECK(source->counters->released.load() == 2);
    }

    SUBCASE("Concurrent callers") {
        std::vector<std::future<file_icon::extraction>> futures;
        for (int i = 0; i < 8; ++i) {
            futures.push_back(extractor.extract_async("/tmp/f" + std::to_string(i), {}));
        }
        for (auto& f : futures) {
            CHECK(f.get().result.ok);
        }
        CHECK(source->counters->released.load() == 8);
    }
}

// ============================================================================
// Output Formats
// ============================================================================

TEST_CASE("Extractor: output formats") {
    auto source = std::make_shared<counted_source>(fixtures::alpha_icon(32));
    file_icon::icon_extractor extractor(source);

    SUBCASE("PNG only") {
        file_icon::encoded_image image;
        REQUIRE(extractor.extract("/tmp/x", with_format(file_icon::output_format::png), image).ok);
        CHECK(file_icon::is_png(image.png));
        CHECK(image.text.empty());
        CHECK(image.format == file_icon::output_format::png);
    }

    SUBCASE("Base64 decodes to exactly the PNG bytes") {
        file_icon::encoded_image image;
        REQUIRE(extractor.extract("/tmp/x", with_format(file_icon::output_format::base64), image).ok);
        auto decoded = file_icon::decode_base64(image.text);
        REQUIRE(decoded.has_value());
        CHECK(*decoded == image.png);
        CHECK(file_icon::is_png(*decoded));
        CHECK(image.text.rfind("iVBORw0KGgo", 0) == 0);
    }

    SUBCASE("Data URL") {
        file_icon::encoded_image image;
        REQUIRE(extractor.extract("/tmp/x", with_format(file_icon::output_format::data_url), image).ok);
        REQUIRE(image.text.rfind(file_icon::PNG_DATA_URL_PREFIX, 0) == 0);
        auto decoded = file_icon::decode_base64(
            std::string_view(image.text).substr(file_icon::PNG_DATA_URL_PREFIX.size()));
        REQUIRE(decoded.has_value());
        CHECK(*decoded == image.png);
    }

    SUBCASE("PNG round-trips to the converted pixels") {
        file_icon::encoded_image image;
        file_icon::pixel_buffer pixels;
        REQUIRE(extractor.extract("/tmp/x", {}, image).ok);
        REQUIRE(extractor.extract_pixels("/tmp/x", {}, pixels).ok);

        file_icon::pixel_buffer decoded;
        REQUIRE(file_icon::decode_png(image.png, decoded).ok);
        CHECK(decoded.width() == pixels.width());
        CHECK(decoded.height() == pixels.height());
        CHECK(std::equal(decoded.pixels().begin(), decoded.pixels().end(), pixels.pixels().begin()));
    }

    SUBCASE("Generic icon is flagged") {
        auto generic = std::make_shared<counted_source>(fixtures::mask_icon(16), fake_behavior::succeed, true);
        file_icon::icon_extractor fallback(generic);
        file_icon::encoded_image image;
        REQUIRE(fallback.extract("/tmp/unknown.zzz", {}, image).ok);
        CHECK(image.is_default);
    }
}

// ============================================================================
// Arguments
// ============================================================================

TEST_CASE("Extractor: argument checks") {
    auto source = std::make_shared<counted_source>(fixtures::alpha_icon(32));
    file_icon::icon_extractor extractor(source);
    file_icon::encoded_image image;

    SUBCASE("Custom size out of range") {
        file_icon::extract_options options;
        options.size = file_icon::icon_size::custom;
        options.width = 0;
        options.height = 32;
        CHECK(extractor.extract("/tmp/x", options, image).error == file_icon::extract_error::invalid_argument);

        options.width = 4096;
        CHECK(extractor.extract("/tmp/x", options, image).error == file_icon::extract_error::invalid_argument);

        // Source is never asked
        CHECK(source->counters->acquired.load() == 0);
    }

    SUBCASE("Custom size reaches the source") {
        file_icon::extract_options options;
        options.size = file_icon::icon_size::custom;
        options.width = 24;
        options.height = 20;
        REQUIRE(extractor.extract("/tmp/x", options, image).ok);
        CHECK(source->last_request.size == file_icon::icon_size::custom);
        CHECK(source->last_request.width == 24);
        CHECK(source->last_request.height == 20);
    }

    SUBCASE("Size classes map to nominal sizes") {
        file_icon::extract_options options;
        options.size = file_icon::icon_size::small;
        REQUIRE(extractor.extract("/tmp/x", options, image).ok);
        CHECK(source->last_request.width == 16);
        options.size = file_icon::icon_size::large;
        REQUIRE(extractor.extract("/tmp/x", options, image).ok);
        CHECK(source->last_request.width == 32);
    }

    SUBCASE("Empty path") {
        CHECK(extractor.extract("", {}, image).error == file_icon::extract_error::invalid_argument);
    }

    SUBCASE("Null source") {
        CHECK_THROWS_AS(file_icon::icon_extractor(nullptr), std::invalid_argument);
    }

    SUBCASE("Bitmap larger than max_dimension") {
        file_icon::extract_options options;
        options.max_dimension = 16;
        CHECK(extractor.extract("/tmp/x", options, image).error == file_icon::extract_error::bitmap_unavailable);
        CHECK(source->counters->released.load() == source->counters->acquired.load());
        CHECK(image.png.empty());
    }
}

// ============================================================================
// Metrics
// ============================================================================

TEST_CASE("Extractor: metrics events") {
    auto metrics = std::make_shared<file_icon::counting_metrics>();

    auto ok_source = std::make_shared<counted_source>(fixtures::alpha_icon(32));
    auto missing_source = std::make_shared<counted_source>(fixtures::alpha_icon(32), fake_behavior::not_found);

    file_icon::icon_extractor ok(ok_source, metrics);
    file_icon::icon_extractor missing(missing_source, metrics);

    file_icon::encoded_image image;
    file_icon::pixel_buffer pixels;
    CHECK(ok.extract("/tmp/a", {}, image).ok);
    CHECK(ok.extract_pixels("/tmp/a", {}, pixels).ok);
    CHECK_FALSE(missing.extract("/tmp/b", {}, image).ok);

    file_icon::extract_options bad;
    bad.size = file_icon::icon_size::custom;
    CHECK_FALSE(ok.extract("/tmp/c", bad, image).ok);

    const auto snap = metrics->snapshot();
    CHECK(snap.calls == 4);
    CHECK(snap.successes() == 2);
    CHECK(snap.failures() == 2);
    CHECK(snap.count(file_icon::extract_error::not_found) == 1);
    CHECK(snap.count(file_icon::extract_error::invalid_argument) == 1);
    CHECK(snap.max_latency <= snap.total_latency);
}
