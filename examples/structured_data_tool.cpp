/**
 * @file structured_data_tool.cpp
 * @brief Reads or attaches the stRT structured data chunk of a PNG file
 *
 * Usage:
 *   structured_data_tool show <file.png>
 *   structured_data_tool set <in.png> <out.png> <TYPE> <json>
 */

#include <pngc/datastream.hh>
#include <pngc/chunks/structured_data.hh>
#include <iostream>
#include <fstream>
#include <string>

static int show(const char* path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << path << "'\n";
        return 1;
    }

    auto chunks = pngc::decode(file);
    const auto* data = chunks.first_of<pngc::structured_data_chunk>();
    if (!data) {
        std::cout << "No structured data\n";
        return 0;
    }

    std::cout << "Type:    " << data->data_type() << "\n";
    std::cout << "Version: " << data->major_version() << "." << data->minor_version() << "\n";
    std::cout << data->content().dump(2) << "\n";
    return 0;
}

static int set(const char* in_path, const char* out_path, const std::string& type, const std::string& json) {
    std::ifstream in(in_path, std::ios::binary);
    if (!in) {
        std::cerr << "Error: Cannot open file '" << in_path << "'\n";
        return 1;
    }

    auto chunks = pngc::decode(in);
    auto* data = chunks.first_of<pngc::structured_data_chunk>();
    if (!data) {
        data = &chunks.emplace<pngc::structured_data_chunk>();
    }
    data->set_data_type(type);
    data->set_major_version(1);
    data->set_content(nlohmann::json::parse(json));

    std::ofstream out(out_path, std::ios::binary);
    if (!out) {
        std::cerr << "Error: Cannot create file '" << out_path << "'\n";
        return 1;
    }
    pngc::encode(out, chunks);
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        if (argc == 3 && std::string(argv[1]) == "show") {
            return show(argv[2]);
        }
        if (argc == 6 && std::string(argv[1]) == "set") {
            return set(argv[2], argv[3], argv[4], argv[5]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Usage: " << argv[0] << " show <file.png>\n";
    std::cout << "       " << argv[0] << " set <in.png> <out.png> <TYPE> <json>\n";
    return 1;
}
