//
// Created by igor on 17/08/2025.
//

#include <pngc/chunks/palette.hh>
#include <pngc/chunks/header.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>

namespace pngc {

    palette_chunk::palette_chunk()
        : chunk(type_name, default_sequence) {}

    rgb palette_chunk::color_at(std::size_t index) const {
        THROW_CHUNK_IF(index >= color_count(), index_out_of_range,
                       "Palette index ", index, " out of range (", color_count(), " colors)");
        const auto* p = m_palette.data() + index * 3;
        return rgb{
            std::to_integer<std::uint8_t>(p[0]),
            std::to_integer<std::uint8_t>(p[1]),
            std::to_integer<std::uint8_t>(p[2])
        };
    }

    void palette_chunk::set_colors(const std::vector<rgb>& colors) {
        m_palette.clear();
        m_palette.reserve(colors.size() * 3);
        for (const auto& c : colors) {
            add_color(c);
        }
    }

    void palette_chunk::add_color(const rgb& color) {
        m_palette.push_back(std::byte{color.r});
        m_palette.push_back(std::byte{color.g});
        m_palette.push_back(std::byte{color.b});
    }

    void palette_chunk::apply_to_image(const chunk_list& siblings,
                                       const std::vector<std::byte>& input, std::size_t input_offset,
                                       std::size_t count,
                                       std::vector<std::byte>& image, std::size_t image_offset) const {
        const auto* header = siblings.first_of<header_chunk>();
        THROW_CHUNK_UNLESS(header, missing_dependency, "Palette expansion requires the IHDR chunk");

        const std::size_t stride = header_chunk::image_bytes_per_pixel();
        THROW_CHUNK_IF(input_offset > input.size() || count > input.size() - input_offset,
                       index_out_of_range, "Index range [", input_offset, ", ", input_offset + count,
                       ") exceeds the input of ", input.size(), " bytes");

        std::size_t out = image_offset;
        for (std::size_t i = 0; i < count; i++) {
            const auto index = std::to_integer<std::size_t>(input[input_offset + i]);
            THROW_CHUNK_IF(index >= color_count(), index_out_of_range,
                           "Pixel ", i, " refers to palette entry ", index, " of ", color_count());
            THROW_CHUNK_IF(out > image.size() || image.size() - out < 3, index_out_of_range,
                           "Pixel ", i, " lies outside the image of ", image.size(), " bytes");

            image[out] = m_palette[index * 3];
            image[out + 1] = m_palette[index * 3 + 1];
            image[out + 2] = m_palette[index * 3 + 2];
            out += stride;
        }
    }

    void palette_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        const auto& header = require_header(ctx);
        require_unique(ctx);
        THROW_CHUNK_IF(length % 3 != 0, malformed_length,
                       "PLTE length must be divisible by 3, got ", length);
        THROW_CHUNK_UNLESS(header.allows_palette(), invalid_for_color_type,
                           "PLTE is not allowed for color type ",
                           unsigned(static_cast<std::uint8_t>(header.color_type())));

        if (header.has_palette()) {
            const std::size_t required = std::size_t{1} << header.bit_depth();
            if (length / 3 < required) {
                ctx.violation<palette_too_small>("palette_size", "Palette has ", length / 3,
                                                 " entries, bit depth ", unsigned(header.bit_depth()),
                                                 " needs ", required);
            }
        }
        require_before(ctx, "IDAT"_4cc);

        m_palette = cursor.read_bytes(length);
    }

    void palette_chunk::encode(byte_cursor& cursor) const {
        cursor.write_bytes(m_palette);
    }

} // namespace pngc
