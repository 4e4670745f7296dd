//
// Created by igor on 18/08/2025.
//

#include <pngc/chunks/color_space.hh>
#include <pngc/chunks/header.hh>
#include <pngc/chunks/palette.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>
#include <pngc/compressor.hh>
#include <cmath>
#include "keyword.hh"

namespace pngc {

    namespace {
        constexpr fourcc idat_name = "IDAT"_4cc;
    }

    // -- gAMA --------------------------------------------------------------------

    gamma_chunk::gamma_chunk()
        : chunk(type_name, default_sequence) {}

    void gamma_chunk::set_gamma(double value) {
        THROW_CHUNK_IF(!(value > 0.0) || value * 100000.0 > 4294967295.0, invalid_field,
                       "Gamma must be positive and fit 32 bits, got ", value);
        m_gamma = static_cast<std::uint32_t>(std::llround(value * 100000.0));
    }

    void gamma_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);
        require_unique(ctx);
        require_length(length, 4);
        require_before(ctx, palette_chunk::type_name);
        require_before(ctx, idat_name);

        m_gamma = cursor.read_u32();
    }

    void gamma_chunk::encode(byte_cursor& cursor) const {
        cursor.write_u32(m_gamma);
    }

    // -- cHRM --------------------------------------------------------------------

    chromaticities_chunk::chromaticities_chunk()
        : chunk(type_name, default_sequence) {}

    void chromaticities_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);
        require_unique(ctx);
        require_length(length, body_size);
        require_before(ctx, palette_chunk::type_name);
        require_before(ctx, idat_name);

        for (auto* point : {&white_point, &red, &green, &blue}) {
            point->x = cursor.read_u32();
            point->y = cursor.read_u32();
        }
    }

    void chromaticities_chunk::encode(byte_cursor& cursor) const {
        for (const auto* point : {&white_point, &red, &green, &blue}) {
            cursor.write_u32(point->x);
            cursor.write_u32(point->y);
        }
    }

    // -- sRGB --------------------------------------------------------------------

    srgb_chunk::srgb_chunk()
        : chunk(type_name, default_sequence) {}

    void srgb_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);
        require_unique(ctx);
        require_length(length, 1);
        require_before(ctx, palette_chunk::type_name);
        require_before(ctx, idat_name);

        auto value = cursor.read_u8();
        if (value > static_cast<std::uint8_t>(rendering_intent::absolute_colorimetric)) {
            ctx.violation<invalid_field>("field", "Unknown sRGB rendering intent ", unsigned(value));
            value = static_cast<std::uint8_t>(rendering_intent::perceptual);
        }
        m_intent = static_cast<rendering_intent>(value);
    }

    void srgb_chunk::encode(byte_cursor& cursor) const {
        cursor.write_u8(static_cast<std::uint8_t>(m_intent));
    }

    // -- iCCP --------------------------------------------------------------------

    icc_profile_chunk::icc_profile_chunk()
        : chunk(type_name, default_sequence) {}

    void icc_profile_chunk::set_profile_name(const std::string& name) {
        internal::check_keyword(name, type());
        m_name = name;
    }

    void icc_profile_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);
        require_unique(ctx);
        require_before(ctx, palette_chunk::type_name);
        require_before(ctx, idat_name);

        const auto start = cursor.position();
        m_name = internal::read_keyword(cursor, length, ctx, type());
        THROW_CHUNK_IF(internal::body_left(cursor, start, length, type()) == 0, malformed_length,
                       "iCCP has no compression method");

        const auto method = cursor.read_u8();
        THROW_CHUNK_IF(method != 0, invalid_field, "Unknown iCCP compression method ", unsigned(method));

        auto packed = cursor.read_bytes(internal::body_left(cursor, start, length, type()));
        try {
            m_profile = compressor().decompress(packed);
        } catch (const compression_error& e) {
            THROW_CHUNK(malformed_payload, "ICC profile \"", m_name, "\" cannot be decompressed: ", e.what());
        }
    }

    void icc_profile_chunk::encode(byte_cursor& cursor) const {
        cursor.write_ascii(m_name);
        cursor.write_u8(0);
        cursor.write_u8(0);
        cursor.write_bytes(compressor().compress(m_profile));
    }

    // -- sBIT --------------------------------------------------------------------

    significant_bits_chunk::significant_bits_chunk()
        : chunk(type_name, default_sequence) {}

    void significant_bits_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        const auto& header = require_header(ctx);
        require_unique(ctx);

        // Indexed images describe the palette's RGB channels
        const std::size_t channels = header.has_palette() ? 3 : header.samples_per_pixel();
        require_length(length, channels);
        require_before(ctx, palette_chunk::type_name);
        require_before(ctx, idat_name);

        const unsigned max_bits = header.has_palette() ? 8 : header.bit_depth();
        m_bits.clear();
        for (std::size_t i = 0; i < channels; i++) {
            const auto bits = cursor.read_u8();
            if (bits == 0 || bits > max_bits) {
                ctx.violation<invalid_field>("field", "sBIT channel ", i, " has ", unsigned(bits),
                                             " significant bits, expected 1 to ", max_bits);
            }
            m_bits.push_back(bits);
        }
    }

    void significant_bits_chunk::encode(byte_cursor& cursor) const {
        for (auto bits : m_bits) {
            cursor.write_u8(bits);
        }
    }

} // namespace pngc
