//
// Created by igor on 18/08/2025.
//

#include <pngc/chunks/transparency.hh>
#include <pngc/chunks/header.hh>
#include <pngc/chunks/palette.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>

namespace pngc {

    namespace {
        sample_layout layout_of(const header_chunk& header) {
            if (header.has_palette()) {
                return sample_layout::palette;
            }
            return header.has_color() ? sample_layout::rgb : sample_layout::gray;
        }

        rgb16 read_rgb16(byte_cursor& cursor) {
            rgb16 c;
            c.r = cursor.read_u16();
            c.g = cursor.read_u16();
            c.b = cursor.read_u16();
            return c;
        }

        void write_rgb16(byte_cursor& cursor, const rgb16& c) {
            cursor.write_u16(c.r);
            cursor.write_u16(c.g);
            cursor.write_u16(c.b);
        }
    }

    // -- tRNS --------------------------------------------------------------------

    transparency_chunk::transparency_chunk()
        : chunk(type_name, default_sequence) {}

    std::uint8_t transparency_chunk::alpha_at(std::size_t index) const {
        return index < m_alpha.size() ? m_alpha[index] : 255;
    }

    void transparency_chunk::set_palette_alpha(std::vector<std::uint8_t> alpha) {
        m_layout = sample_layout::palette;
        m_alpha = std::move(alpha);
    }

    void transparency_chunk::set_gray(std::uint16_t gray) {
        m_layout = sample_layout::gray;
        m_gray = gray;
    }

    void transparency_chunk::set_color(const rgb16& color) {
        m_layout = sample_layout::rgb;
        m_color = color;
    }

    bool transparency_chunk::use_chunk() const {
        return m_layout != sample_layout::palette || !m_alpha.empty();
    }

    void transparency_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        const auto& header = require_header(ctx);
        require_unique(ctx);
        THROW_CHUNK_IF(header.has_alpha(), invalid_for_color_type,
                       "tRNS is not allowed for color type ",
                       unsigned(static_cast<std::uint8_t>(header.color_type())));
        require_before(ctx, "IDAT"_4cc);

        m_layout = layout_of(header);
        switch (m_layout) {
            case sample_layout::palette: {
                require_predecessor(ctx, palette_chunk::type_name);
                const auto* palette = ctx.siblings.first_of<palette_chunk>();
                const std::size_t colors = palette ? palette->color_count() : 0;
                THROW_CHUNK_IF(length > colors, malformed_length,
                               "tRNS has ", length, " entries, the palette only ", colors);
                m_alpha.clear();
                for (std::size_t i = 0; i < length; i++) {
                    m_alpha.push_back(cursor.read_u8());
                }
                break;
            }
            case sample_layout::gray:
                require_length(length, 2);
                m_gray = cursor.read_u16();
                break;
            case sample_layout::rgb:
                require_length(length, 6);
                m_color = read_rgb16(cursor);
                break;
        }
    }

    void transparency_chunk::encode(byte_cursor& cursor) const {
        switch (m_layout) {
            case sample_layout::palette:
                for (auto a : m_alpha) {
                    cursor.write_u8(a);
                }
                break;
            case sample_layout::gray:
                cursor.write_u16(m_gray);
                break;
            case sample_layout::rgb:
                write_rgb16(cursor, m_color);
                break;
        }
    }

    // -- bKGD --------------------------------------------------------------------

    background_chunk::background_chunk()
        : chunk(type_name, default_sequence) {}

    void background_chunk::set_palette_index(std::uint8_t index) {
        m_layout = sample_layout::palette;
        m_index = index;
    }

    void background_chunk::set_gray(std::uint16_t gray) {
        m_layout = sample_layout::gray;
        m_gray = gray;
    }

    void background_chunk::set_color(const rgb16& color) {
        m_layout = sample_layout::rgb;
        m_color = color;
    }

    void background_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        const auto& header = require_header(ctx);
        require_unique(ctx);
        require_before(ctx, "IDAT"_4cc);

        m_layout = layout_of(header);
        switch (m_layout) {
            case sample_layout::palette: {
                require_predecessor(ctx, palette_chunk::type_name);
                require_length(length, 1);
                m_index = cursor.read_u8();
                const auto* palette = ctx.siblings.first_of<palette_chunk>();
                if (palette && m_index >= palette->color_count()) {
                    ctx.violation<index_out_of_range>("field", "bKGD refers to palette entry ",
                                                      unsigned(m_index), " of ", palette->color_count());
                }
                break;
            }
            case sample_layout::gray:
                require_length(length, 2);
                m_gray = cursor.read_u16();
                break;
            case sample_layout::rgb:
                require_length(length, 6);
                m_color = read_rgb16(cursor);
                break;
        }
    }

    void background_chunk::encode(byte_cursor& cursor) const {
        switch (m_layout) {
            case sample_layout::palette:
                cursor.write_u8(m_index);
                break;
            case sample_layout::gray:
                cursor.write_u16(m_gray);
                break;
            case sample_layout::rgb:
                write_rgb16(cursor, m_color);
                break;
        }
    }

} // namespace pngc
