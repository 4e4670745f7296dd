//
// Created by igor on 19/08/2025.
//

#include <pngc/chunks/text.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>
#include <pngc/compressor.hh>
#include "keyword.hh"

namespace pngc {

    namespace {
        std::vector<std::byte> to_bytes(const std::string& text) {
            const auto* first = reinterpret_cast<const std::byte*>(text.data());
            return {first, first + text.size()};
        }

        std::string as_string(const std::vector<std::byte>& bytes) {
            const auto* first = reinterpret_cast<const char*>(bytes.data());
            return {first, first + bytes.size()};
        }

        std::string inflate_text(const std::vector<std::byte>& packed, fourcc type, const std::string& keyword) {
            try {
                return as_string(compressor().decompress(packed));
            } catch (const compression_error& e) {
                THROW_CHUNK(malformed_payload, "Text of ", type, " chunk \"", keyword,
                            "\" cannot be decompressed: ", e.what());
            }
        }
    }

    // -- tEXt --------------------------------------------------------------------

    text_chunk::text_chunk()
        : chunk(type_name, default_sequence) {}

    text_chunk::text_chunk(const std::string& keyword, std::string text)
        : chunk(type_name, default_sequence), m_text(std::move(text)) {
        set_keyword(keyword);
    }

    text_chunk::text_chunk(fourcc type, int sequence)
        : chunk(type, sequence) {}

    void text_chunk::set_keyword(const std::string& keyword) {
        internal::check_keyword(keyword, type());
        m_keyword = keyword;
    }

    void text_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);

        const auto start = cursor.position();
        m_keyword = internal::read_keyword(cursor, length, ctx, type());
        m_text = cursor.read_string(internal::body_left(cursor, start, length, type()));
    }

    void text_chunk::encode(byte_cursor& cursor) const {
        cursor.write_ascii(m_keyword);
        cursor.write_u8(0);
        cursor.write_ascii(m_text);
    }

    // -- zTXt --------------------------------------------------------------------

    compressed_text_chunk::compressed_text_chunk()
        : text_chunk(type_name, default_sequence) {}

    compressed_text_chunk::compressed_text_chunk(const std::string& keyword, std::string text)
        : text_chunk(type_name, default_sequence) {
        set_keyword(keyword);
        set_text(std::move(text));
    }

    void compressed_text_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);

        const auto start = cursor.position();
        m_keyword = internal::read_keyword(cursor, length, ctx, type());
        THROW_CHUNK_IF(internal::body_left(cursor, start, length, type()) == 0, malformed_length,
                       "zTXt has no compression method");

        const auto method = cursor.read_u8();
        THROW_CHUNK_IF(method != 0, invalid_field, "Unknown zTXt compression method ", unsigned(method));

        auto packed = cursor.read_bytes(internal::body_left(cursor, start, length, type()));
        m_text = inflate_text(packed, type(), m_keyword);
    }

    void compressed_text_chunk::encode(byte_cursor& cursor) const {
        cursor.write_ascii(m_keyword);
        cursor.write_u8(0);
        cursor.write_u8(0);
        cursor.write_bytes(compressor().compress(to_bytes(m_text)));
    }

    // -- iTXt --------------------------------------------------------------------

    international_text_chunk::international_text_chunk()
        : text_chunk(type_name, default_sequence) {}

    void international_text_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);

        const auto start = cursor.position();
        m_keyword = internal::read_keyword(cursor, length, ctx, type());
        THROW_CHUNK_IF(internal::body_left(cursor, start, length, type()) < 2, malformed_length,
                       "iTXt has no compression flag and method");

        const auto flag = cursor.read_u8();
        const auto method = cursor.read_u8();
        THROW_CHUNK_IF(flag > 1, invalid_field, "Unknown iTXt compression flag ", unsigned(flag));
        THROW_CHUNK_IF(flag == 1 && method != 0, invalid_field,
                       "Unknown iTXt compression method ", unsigned(method));
        m_compressed = flag == 1;

        auto left = internal::body_left(cursor, start, length, type());
        THROW_CHUNK_IF(left == 0, malformed_length, "iTXt has no language tag");
        m_language = cursor.read_until_nul(left - 1);

        left = internal::body_left(cursor, start, length, type());
        THROW_CHUNK_IF(left == 0, malformed_length, "iTXt has no translated keyword");
        m_translated = cursor.read_until_nul(left - 1);

        auto text = cursor.read_bytes(internal::body_left(cursor, start, length, type()));
        m_text = m_compressed ? inflate_text(text, type(), m_keyword) : as_string(text);
    }

    void international_text_chunk::encode(byte_cursor& cursor) const {
        cursor.write_ascii(m_keyword);
        cursor.write_u8(0);
        cursor.write_u8(m_compressed ? 1 : 0);
        cursor.write_u8(0);
        cursor.write_ascii(m_language);
        cursor.write_u8(0);
        cursor.write_ascii(m_translated);
        cursor.write_u8(0);
        if (m_compressed) {
            cursor.write_bytes(compressor().compress(to_bytes(m_text)));
        } else {
            cursor.write_ascii(m_text);
        }
    }

    // -- tIME --------------------------------------------------------------------

    time_chunk::time_chunk()
        : chunk(type_name, default_sequence) {}

    bool time_chunk::is_valid() const {
        return month >= 1 && month <= 12 &&
               day >= 1 && day <= 31 &&
               hour <= 23 && minute <= 59 && second <= 60;
    }

    void time_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);
        require_unique(ctx);
        require_length(length, body_size);

        year = cursor.read_u16();
        month = cursor.read_u8();
        day = cursor.read_u8();
        hour = cursor.read_u8();
        minute = cursor.read_u8();
        second = cursor.read_u8();

        if (!is_valid()) {
            ctx.violation<invalid_field>("field", "tIME ", year, "-", unsigned(month), "-", unsigned(day), " ",
                                         unsigned(hour), ":", unsigned(minute), ":", unsigned(second),
                                         " is out of range");
        }
    }

    void time_chunk::encode(byte_cursor& cursor) const {
        cursor.write_u16(year);
        cursor.write_u8(month);
        cursor.write_u8(day);
        cursor.write_u8(hour);
        cursor.write_u8(minute);
        cursor.write_u8(second);
    }

} // namespace pngc
