//
// Created by igor on 19/08/2025.
//

#pragma once

#include <string>
#include <pngc/chunk.hh>
#include <pngc/byte_cursor.hh>
#include <pngc/chunks/text.hh>

namespace pngc::internal {

    // Body bytes left after the fields read since start; throws malformed_length past the end of the body
    inline std::size_t body_left(const byte_cursor& cursor, std::size_t start, std::size_t length, fourcc type) {
        const std::size_t used = cursor.position() - start;
        THROW_CHUNK_IF(used > length, malformed_length, "Chunk ", type, " is shorter than its fields");
        return length - used;
    }

    // NUL terminated keyword inside a chunk body; length is validated against
    // the 1-79 byte rule in the strictness of ctx
    inline std::string read_keyword(byte_cursor& cursor, std::size_t left, const decode_context& ctx, fourcc type) {
        THROW_CHUNK_IF(left == 0, malformed_length, "Chunk ", type, " has no keyword");
        std::string keyword = cursor.read_until_nul(left - 1);
        if (keyword.empty() || keyword.size() > max_keyword_length) {
            ctx.violation<invalid_field>("field", "Keyword of ", type, " must be 1 to ",
                                         max_keyword_length, " bytes, got ", keyword.size());
        }
        return keyword;
    }

    inline void check_keyword(const std::string& keyword, fourcc type) {
        THROW_CHUNK_IF(keyword.empty() || keyword.size() > max_keyword_length, invalid_field,
                       "Keyword of ", type, " must be 1 to ", max_keyword_length,
                       " bytes, got ", keyword.size());
    }

} // namespace pngc::internal

