//
// Created by igor on 14/08/2025.
//

#include <pngc/chunk_reader.hh>
#include <pngc/exceptions.hh>

namespace pngc {

    // Default implementations for chunk_reader convenience methods
    std::optional<std::string> chunk_reader::read_string(std::size_t size) {
        std::string result(size, '\0');
        if (size == 0) {
            return result;
        }

        std::size_t actual = read(result.data(), size);
        if (actual != size) {
            return std::nullopt;
        }
        return result;
    }

    std::vector<std::byte> chunk_reader::read_all() {
        auto to_read = static_cast<std::size_t>(remaining());
        std::vector<std::byte> result(to_read);

        std::size_t total = 0;
        while (total < to_read) {
            std::size_t actual = read(result.data() + total, to_read - total);
            THROW_IO_IF(actual == 0, "Unexpected end of stream: chunk body needs ", to_read,
                        " bytes, got ", total);
            total += actual;
        }

        return result;
    }

} // namespace pngc
