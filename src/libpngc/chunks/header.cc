//
// Created by igor on 17/08/2025.
//

#include <pngc/chunks/header.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>

namespace pngc {

    header_chunk::header_chunk()
        : chunk(type_name, default_sequence) {}

    bool header_chunk::is_valid_format(std::uint8_t type, std::uint8_t bit_depth) {
        switch (static_cast<pngc::color_type>(type)) {
            case pngc::color_type::grayscale:
                return bit_depth == 1 || bit_depth == 2 || bit_depth == 4 || bit_depth == 8 || bit_depth == 16;
            case pngc::color_type::indexed:
                return bit_depth == 1 || bit_depth == 2 || bit_depth == 4 || bit_depth == 8;
            case pngc::color_type::truecolor:
            case pngc::color_type::grayscale_alpha:
            case pngc::color_type::truecolor_alpha:
                return bit_depth == 8 || bit_depth == 16;
        }
        return false;
    }

    void header_chunk::set_width(std::uint32_t width) {
        THROW_CHUNK_IF(width == 0 || width > max_format_chunk_size, invalid_field,
                       "Image width must be between 1 and ", max_format_chunk_size, ", got ", width);
        m_width = width;
    }

    void header_chunk::set_height(std::uint32_t height) {
        THROW_CHUNK_IF(height == 0 || height > max_format_chunk_size, invalid_field,
                       "Image height must be between 1 and ", max_format_chunk_size, ", got ", height);
        m_height = height;
    }

    void header_chunk::set_format(pngc::color_type type, std::uint8_t bit_depth) {
        THROW_CHUNK_UNLESS(is_valid_format(static_cast<std::uint8_t>(type), bit_depth), invalid_field,
                           "Bit depth ", unsigned(bit_depth), " is not allowed for color type ",
                           unsigned(static_cast<std::uint8_t>(type)));
        m_color_type = type;
        m_bit_depth = bit_depth;
    }

    void header_chunk::set_interlace_method(std::uint8_t method) {
        THROW_CHUNK_IF(method > 1, invalid_field, "Unknown interlace method ", unsigned(method));
        m_interlace = method;
    }

    bool header_chunk::has_palette() const {
        return m_color_type == pngc::color_type::indexed;
    }

    bool header_chunk::allows_palette() const {
        return m_color_type == pngc::color_type::indexed ||
               m_color_type == pngc::color_type::truecolor ||
               m_color_type == pngc::color_type::truecolor_alpha;
    }

    bool header_chunk::has_color() const {
        return (static_cast<std::uint8_t>(m_color_type) & 2) != 0;
    }

    bool header_chunk::has_alpha() const {
        return (static_cast<std::uint8_t>(m_color_type) & 4) != 0;
    }

    unsigned header_chunk::samples_per_pixel() const {
        switch (m_color_type) {
            case pngc::color_type::grayscale: return 1;
            case pngc::color_type::truecolor: return 3;
            case pngc::color_type::indexed: return 1;
            case pngc::color_type::grayscale_alpha: return 2;
            case pngc::color_type::truecolor_alpha: return 4;
        }
        return 0;
    }

    unsigned header_chunk::bits_per_pixel() const {
        return samples_per_pixel() * m_bit_depth;
    }

    void header_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_unique(ctx);
        if (!ctx.siblings.empty()) {
            ctx.violation<order_violation>("order", "IHDR must be the first chunk, found after ",
                                           ctx.siblings.size(), " other chunk(s)");
        }
        require_length(length, body_size);

        std::uint32_t width = cursor.read_u32();
        std::uint32_t height = cursor.read_u32();
        std::uint8_t bit_depth = cursor.read_u8();
        std::uint8_t type = cursor.read_u8();
        std::uint8_t compression = cursor.read_u8();
        std::uint8_t filter = cursor.read_u8();
        std::uint8_t interlace = cursor.read_u8();

        set_width(width);
        set_height(height);
        THROW_CHUNK_UNLESS(is_valid_format(type, bit_depth), invalid_field,
                           "Invalid color type ", unsigned(type), " / bit depth ", unsigned(bit_depth),
                           " combination");
        THROW_CHUNK_IF(compression != 0, invalid_field, "Unknown compression method ", unsigned(compression));
        THROW_CHUNK_IF(filter != 0, invalid_field, "Unknown filter method ", unsigned(filter));
        set_interlace_method(interlace);

        m_bit_depth = bit_depth;
        m_color_type = static_cast<pngc::color_type>(type);
        m_compression = compression;
        m_filter = filter;
    }

    void header_chunk::encode(byte_cursor& cursor) const {
        cursor.write_u32(m_width);
        cursor.write_u32(m_height);
        cursor.write_u8(m_bit_depth);
        cursor.write_u8(static_cast<std::uint8_t>(m_color_type));
        cursor.write_u8(m_compression);
        cursor.write_u8(m_filter);
        cursor.write_u8(m_interlace);
    }

} // namespace pngc
