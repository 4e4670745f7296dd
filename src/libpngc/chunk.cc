//
// Created by igor on 16/08/2025.
//

#include <pngc/chunk.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>
#include <pngc/chunks/header.hh>

namespace pngc {

    void decode_context::warn(std::string_view category, const std::string& message) const {
        if (options.on_warning) {
            options.on_warning(file_offset, category, message);
        }
    }

    chunk::chunk(fourcc type, int sequence)
        : m_type(type), m_sequence(sequence) {}

    void chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        THROW_CHUNK_IF(is_critical(), unknown_critical_chunk,
                       "Unknown chunk type ", m_type, " is declared critical. Stopping decoder.");

        cursor.skip(length);
        ctx.warn("unknown_chunk", build_error_msg("Skipping unknown ancillary chunk ", m_type,
                                                  " (", length, " bytes)"));
    }

    void chunk::encode(byte_cursor&) const {
        THROW_CHUNK(unimplemented_encode, "Chunk type ", m_type, " cannot be encoded");
    }

    void chunk::require_unique(const decode_context& ctx) const {
        THROW_CHUNK_IF(ctx.siblings.contains(m_type), duplicate_chunk,
                       "Only one ", m_type, " chunk is allowed in the data");
    }

    const header_chunk& chunk::require_header(const decode_context& ctx) const {
        const auto* header = ctx.siblings.first_of<header_chunk>();
        THROW_CHUNK_UNLESS(header, missing_dependency,
                           "Chunk ", m_type, " requires the IHDR chunk");
        return *header;
    }

    const chunk& chunk::require_predecessor(const decode_context& ctx, fourcc other) const {
        const chunk* found = ctx.siblings.first(other);
        THROW_CHUNK_UNLESS(found, missing_dependency,
                           "Chunk ", m_type, " requires a preceding ", other, " chunk");
        return *found;
    }

    void chunk::require_before(const decode_context& ctx, fourcc other) const {
        if (ctx.siblings.contains(other)) {
            ctx.violation<order_violation>("order", "Chunk ", m_type, " must appear before ", other);
        }
    }

    void chunk::require_length(std::size_t length, std::size_t expected) const {
        THROW_CHUNK_IF(length != expected, malformed_length,
                       "Chunk ", m_type, " must have a length of ", expected, " bytes, got ", length);
    }

} // namespace pngc
