#include <doctest/doctest.h>
#include <file_icon/file_icon.hpp>

#if defined(_WIN32)

#include "helpers/icon_fixtures.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>

#include <windows.h>
#include <aclapi.h>

namespace {

std::filesystem::path windows_dir() {
    const char* root = std::getenv("SystemRoot");
    return root ? std::filesystem::path(root) : std::filesystem::path("C:\\Windows");
}

// Replaces the DACL of a file; nullptr grants everyone full access
DWORD set_dacl(const std::filesystem::path& path, PACL acl, SECURITY_INFORMATION inheritance) {
    std::wstring name = path.wstring();
    return ::SetNamedSecurityInfoW(name.data(), SE_FILE_OBJECT, DACL_SECURITY_INFORMATION | inheritance,
                                   nullptr, nullptr, acl, nullptr);
}

} // namespace

// ============================================================================
// Windows Shell Source Tests
// ============================================================================

TEST_CASE("Shell source: default source") {
    CHECK(file_icon::make_default_source()->name() == "shell");
}

TEST_CASE("Shell source: system executable") {
    const auto notepad = windows_dir() / "notepad.exe";
    REQUIRE(std::filesystem::exists(notepad));

    file_icon::icon_extractor extractor(std::make_shared<file_icon::shell_source>());

    SUBCASE("Large icon") {
        file_icon::pixel_buffer pixels;
        REQUIRE(extractor.extract_pixels(notepad, {}, pixels).ok);
        CHECK(pixels.width() >= 32);
        CHECK(pixels.count_opaque() > 0);
    }

    SUBCASE("Small icon") {
        file_icon::extract_options options;
        options.size = file_icon::icon_size::small;
        file_icon::pixel_buffer pixels;
        REQUIRE(extractor.extract_pixels(notepad, options, pixels).ok);
        CHECK(pixels.width() >= 16);
        CHECK(pixels.count_opaque() > 0);
    }

    SUBCASE("Custom size") {
        file_icon::extract_options options;
        options.size = file_icon::icon_size::custom;
        options.width = 64;
        options.height = 64;
        file_icon::pixel_buffer pixels;
        REQUIRE(extractor.extract_pixels(notepad, options, pixels).ok);
        CHECK(pixels.width() > 0);
    }

    SUBCASE("Base64 output") {
        file_icon::extract_options options;
        options.format = file_icon::output_format::base64;
        file_icon::encoded_image image;
        REQUIRE(extractor.extract(notepad, options, image).ok);
        auto decoded = file_icon::decode_base64(image.text);
        REQUIRE(decoded.has_value());
        CHECK(file_icon::is_png(*decoded));
        CHECK_FALSE(image.is_default);
    }
}

TEST_CASE("Shell source: missing path") {
    file_icon::icon_extractor extractor(std::make_shared<file_icon::shell_source>());
    file_icon::encoded_image image;
    auto result = extractor.extract("C:\\does\\not\\exist.txt", {}, image);
    CHECK_FALSE(result.ok);
    CHECK(result.error == file_icon::extract_error::not_found);
}

TEST_CASE("Shell source: file without read access") {
    fixtures::temp_dir dir;
    const auto path = dir.write("locked.ico", fixtures::make_ico({
        {16, 16, 24, fixtures::make_dib(fixtures::mask_icon(16))}}));

    // An empty DACL denies everyone; the owner keeps WRITE_DAC to undo it
    ACL empty;
    REQUIRE(::InitializeAcl(&empty, sizeof(ACL), ACL_REVISION));
    REQUIRE(set_dacl(path, &empty, PROTECTED_DACL_SECURITY_INFORMATION) == ERROR_SUCCESS);

    file_icon::icon_extractor extractor(std::make_shared<file_icon::shell_source>());
    file_icon::encoded_image image;
    auto result = extractor.extract(path, {}, image);

    CHECK(set_dacl(path, nullptr, UNPROTECTED_DACL_SECURITY_INFORMATION) == ERROR_SUCCESS);
    CHECK_FALSE(result.ok);
    CHECK(result.error == file_icon::extract_error::permission_denied);
    CHECK(image.png.empty());
}

#else

TEST_CASE("Default source is the file source") {
    CHECK(file_icon::make_default_source()->name() == file_icon::file_source::source_name);
}

#endif
