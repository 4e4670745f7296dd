//
// Created by igor on 18/08/2025.
//

#include <pngc/chunks/physical.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>
#include "keyword.hh"

namespace pngc {

    // -- pHYs --------------------------------------------------------------------

    physical_dimensions_chunk::physical_dimensions_chunk()
        : chunk(type_name, default_sequence) {}

    void physical_dimensions_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);
        require_unique(ctx);
        require_length(length, body_size);
        require_before(ctx, "IDAT"_4cc);

        pixels_per_unit_x = cursor.read_u32();
        pixels_per_unit_y = cursor.read_u32();
        auto value = cursor.read_u8();
        if (value > metre) {
            ctx.violation<invalid_field>("field", "Unknown pHYs unit specifier ", unsigned(value));
            value = unknown;
        }
        unit = static_cast<unit_type>(value);
    }

    void physical_dimensions_chunk::encode(byte_cursor& cursor) const {
        cursor.write_u32(pixels_per_unit_x);
        cursor.write_u32(pixels_per_unit_y);
        cursor.write_u8(unit);
    }

    // -- sPLT --------------------------------------------------------------------

    suggested_palette_chunk::suggested_palette_chunk()
        : chunk(type_name, default_sequence) {}

    void suggested_palette_chunk::set_name(const std::string& name) {
        internal::check_keyword(name, type());
        m_name = name;
    }

    void suggested_palette_chunk::set_sample_depth(std::uint8_t depth) {
        THROW_CHUNK_IF(depth != 8 && depth != 16, invalid_field,
                       "sPLT sample depth must be 8 or 16, got ", unsigned(depth));
        m_depth = depth;
    }

    void suggested_palette_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);
        require_before(ctx, "IDAT"_4cc);

        const auto start = cursor.position();
        m_name = internal::read_keyword(cursor, length, ctx, type());
        for (const auto* other : ctx.siblings.all_of<suggested_palette_chunk>()) {
            THROW_CHUNK_IF(other->name() == m_name, duplicate_chunk,
                           "Only one sPLT chunk named \"", m_name, "\" is allowed");
        }

        THROW_CHUNK_IF(internal::body_left(cursor, start, length, type()) == 0, malformed_length,
                       "sPLT has no sample depth");
        set_sample_depth(cursor.read_u8());

        const std::size_t entry_size = m_depth == 8 ? 6 : 10;
        const std::size_t left = internal::body_left(cursor, start, length, type());
        THROW_CHUNK_IF(left % entry_size != 0, malformed_length,
                       "sPLT entries need a multiple of ", entry_size, " bytes, got ", left);

        entries.clear();
        entries.reserve(left / entry_size);
        for (std::size_t i = 0; i < left / entry_size; i++) {
            suggested_palette_entry e;
            if (m_depth == 8) {
                e.red = cursor.read_u8();
                e.green = cursor.read_u8();
                e.blue = cursor.read_u8();
                e.alpha = cursor.read_u8();
            } else {
                e.red = cursor.read_u16();
                e.green = cursor.read_u16();
                e.blue = cursor.read_u16();
                e.alpha = cursor.read_u16();
            }
            e.frequency = cursor.read_u16();
            entries.push_back(e);
        }
    }

    void suggested_palette_chunk::encode(byte_cursor& cursor) const {
        cursor.write_ascii(m_name);
        cursor.write_u8(0);
        cursor.write_u8(m_depth);
        for (const auto& e : entries) {
            if (m_depth == 8) {
                cursor.write_u8(static_cast<std::uint8_t>(e.red));
                cursor.write_u8(static_cast<std::uint8_t>(e.green));
                cursor.write_u8(static_cast<std::uint8_t>(e.blue));
                cursor.write_u8(static_cast<std::uint8_t>(e.alpha));
            } else {
                cursor.write_u16(e.red);
                cursor.write_u16(e.green);
                cursor.write_u16(e.blue);
                cursor.write_u16(e.alpha);
            }
            cursor.write_u16(e.frequency);
        }
    }

} // namespace pngc
