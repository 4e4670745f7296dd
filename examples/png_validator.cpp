/**
 * @file png_validator.cpp
 * @brief Validates a PNG file and reports every deviation found
 *
 * The file is decoded twice: leniently to collect all warnings, then
 * strictly to get the verdict.
 */

#include <pngc/datastream.hh>
#include <pngc/exceptions.hh>
#include <pngc/chunks/header.hh>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>

struct finding {
    std::uint64_t offset;
    std::string category;
    std::string message;
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <file.png> [--max-chunk-size N]\n";
        return 1;
    }

    pngc::parse_options options;
    if (argc == 4 && std::string(argv[2]) == "--max-chunk-size") {
        options.max_chunk_size = static_cast<std::uint32_t>(std::stoul(argv[3]));
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    std::vector<finding> findings;
    options.strict = false;
    options.on_warning = [&findings](std::uint64_t offset, std::string_view category, std::string_view message) {
        findings.push_back({offset, std::string(category), std::string(message)});
    };

    try {
        auto chunks = pngc::decode(file, pngc::chunk_type_table::defaults(), options);
        std::cout << chunks.size() << " chunks decoded\n";
        if (const auto* header = chunks.first_of<pngc::header_chunk>()) {
            std::cout << "Image: " << header->width() << "x" << header->height()
                      << ", bit depth " << unsigned(header->bit_depth())
                      << ", color type " << unsigned(static_cast<std::uint8_t>(header->color_type())) << "\n";
        }
        std::cout << pngc::image_data(chunks).size() << " bytes of image data\n";
    } catch (const pngc::chunk_error& e) {
        std::cerr << "Invalid chunk (" << pngc::to_string(e.kind()) << "): " << e.what() << "\n";
        return 2;
    } catch (const pngc::pngc_error& e) {
        std::cerr << "Invalid file: " << e.what() << "\n";
        return 2;
    }

    for (const auto& f : findings) {
        std::cout << "  [" << f.category << "] at offset " << f.offset << ": " << f.message << "\n";
    }

    file.clear();
    file.seekg(0);
    options.strict = true;
    options.on_warning = nullptr;
    try {
        (void)pngc::decode(file, pngc::chunk_type_table::defaults(), options);
        std::cout << "Valid\n";
    } catch (const pngc::pngc_error& e) {
        std::cout << "Not valid in strict mode: " << e.what() << "\n";
        return 3;
    }

    return 0;
}
