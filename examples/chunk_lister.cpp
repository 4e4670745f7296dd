/**
 * @file chunk_lister.cpp
 * @brief Lists the records of a PNG file with their property bits
 *
 * Walks the datastream record by record without decoding the bodies,
 * so it also works on files with unknown or damaged chunks.
 */

#include <pngc/datastream.hh>
#include <iostream>
#include <iomanip>
#include <fstream>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file.png>\n";
        std::cout << "\n";
        std::cout << "Lists all chunks in a PNG file.\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    std::cout << "Chunks of: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    try {
        pngc::for_each_chunk(file, [](const auto& chunk) {
            const auto& id = chunk.header.id;
            std::cout << std::setw(4) << chunk.index << "  " << id.to_string()
                      << "  offset " << std::setw(10) << chunk.header.file_offset
                      << "  size " << std::setw(10) << chunk.header.size
                      << "  " << (pngc::is_critical(id) ? "critical " : "ancillary")
                      << " " << (pngc::is_public(id) ? "public " : "private")
                      << " " << (pngc::is_safe_to_copy(id) ? "safe-to-copy" : "unsafe-to-copy")
                      << "\n";
        });

        std::cout << "\nDone.\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
