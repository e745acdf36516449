#include <file_icon/file_icon.hpp>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <path> [output.png]\n";
    std::cerr << "Extracts the icon of a file and saves it as PNG.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -s, --small       Small icon\n";
    std::cerr << "  -l, --large       Large icon (default)\n";
    std::cerr << "  --size WxH        Custom size, best effort\n";
    std::cerr << "  --base64          Print base64 instead of saving\n";
    std::cerr << "  --data-url        Print a data:image/png URL instead of saving\n";
    std::cerr << "  -v, --verbose     Debug logging\n";
    std::cerr << "  -h, --help        Show this help\n";
}

bool parse_size(const char* text, int& width, int& height) {
    return std::sscanf(text, "%dx%d", &width, &height) == 2 && width > 0 && height > 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    file_icon::extract_options options;
    const char* input = nullptr;
    const char* output = nullptr;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--small") == 0) {
            options.size = file_icon::icon_size::small;
        } else if (std::strcmp(arg, "-l") == 0 || std::strcmp(arg, "--large") == 0) {
            options.size = file_icon::icon_size::large;
        } else if (std::strcmp(arg, "--size") == 0) {
            if (i + 1 >= argc || !parse_size(argv[i + 1], options.width, options.height)) {
                std::cerr << "Error: --size expects WxH\n";
                return 1;
            }
            options.size = file_icon::icon_size::custom;
            ++i;
        } else if (std::strcmp(arg, "--base64") == 0) {
            options.format = file_icon::output_format::base64;
        } else if (std::strcmp(arg, "--data-url") == 0) {
            options.format = file_icon::output_format::data_url;
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            file_icon::log::set_level(file_icon::log::level::debug);
        } else if (!input) {
            input = arg;
        } else if (!output) {
            output = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!input) {
        print_usage(argv[0]);
        return 1;
    }

    const std::filesystem::path input_path(input);
    file_icon::icon_extractor extractor;

    std::cerr << "Source: " << extractor.source().name() << "\n";

    file_icon::encoded_image image;
    auto result = extractor.extract(input_path, options, image);
    if (!result) {
        std::cerr << "Error: " << file_icon::to_string(result.error) << ": " << result.message << "\n";
        return 2;
    }

    std::cerr << "Extracted: " << image.width << "x" << image.height
              << (image.is_default ? " (generic icon)" : "") << "\n";

    if (options.format != file_icon::output_format::png) {
        std::cout << image.text << "\n";
        return 0;
    }

    // Use second argument as output path, or the input name with .png extension
    std::filesystem::path output_path;
    if (output) {
        output_path = output;
    } else {
        output_path = input_path.filename();
        output_path += ".png";
    }

    if (!file_icon::write_file(image.png, output_path)) {
        std::cerr << "Error: Failed to save: " << output_path << "\n";
        return 1;
    }

    std::cerr << "Saved: " << output_path << "\n";

    return 0;
}
