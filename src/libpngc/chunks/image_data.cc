//
// Created by igor on 17/08/2025.
//

#include <pngc/chunks/image_data.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>

namespace pngc {

    image_data_chunk::image_data_chunk()
        : chunk(type_name, default_sequence) {}

    image_data_chunk::image_data_chunk(std::vector<std::byte> data)
        : chunk(type_name, default_sequence), m_data(std::move(data)) {}

    void image_data_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);

        // IDAT chunks form one run: a previous IDAT must be the last decoded chunk
        const chunk* last = ctx.siblings.back();
        if (ctx.siblings.contains(type_name) && last && last->type() != type_name) {
            ctx.violation<order_violation>("order", "IDAT chunks must be consecutive, found ",
                                           last->type(), " in between");
        }

        m_data = cursor.read_bytes(length);
    }

    void image_data_chunk::encode(byte_cursor& cursor) const {
        cursor.write_bytes(m_data);
    }

    end_chunk::end_chunk()
        : chunk(type_name, default_sequence) {}

    void end_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);
        require_unique(ctx);
        if (length != 0) {
            THROW_CHUNK_IF(ctx.strict(), malformed_length,
                           "IEND must be empty, got ", length, " bytes");
            ctx.warn("length", build_error_msg("Ignoring ", length, " bytes in IEND"));
            cursor.skip(length);
        }
    }

    void end_chunk::encode(byte_cursor&) const {}

} // namespace pngc
