/**
 * @file byte_cursor.hh
 * @brief Sequential reader/writer over an in-memory chunk body
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <pngc/export_pngc.h>

namespace pngc {

    /**
     * @class byte_cursor
     * @brief Byte buffer with a moving read position and append-only writes
     *
     * Chunk decoders read their body through a cursor positioned at the
     * start of the body; encoders append their body to an empty cursor.
     * All integers are big-endian. Every read either consumes exactly the
     * requested width or throws io_error without moving the position.
     */
    class PNGC_EXPORT byte_cursor {
    public:
        byte_cursor() = default;
        explicit byte_cursor(std::vector<std::byte> data);

        // Reading
        std::uint8_t read_u8();
        std::uint16_t read_u16();
        std::uint32_t read_u32();

        /**
         * @brief Read a fixed-length string (bytes are taken verbatim)
         */
        std::string read_string(std::size_t size);

        /**
         * @brief Read bytes up to a NUL separator
         * @param max_length Maximum accepted length before the NUL
         * @return The bytes before the separator; the separator is consumed
         *
         * Throws io_error if no separator is found within max_length + 1
         * bytes or before the end of the data.
         */
        std::string read_until_nul(std::size_t max_length);

        std::vector<std::byte> read_bytes(std::size_t size);
        void skip(std::size_t size);

        // Writing
        void write_u8(std::uint8_t value);
        void write_u16(std::uint16_t value);
        void write_u32(std::uint32_t value);
        void write_ascii(std::string_view text);
        void write_bytes(const std::vector<std::byte>& bytes);
        void write_bytes(const void* data, std::size_t size);

        // Status
        [[nodiscard]] std::size_t position() const { return m_position; }
        [[nodiscard]] std::size_t size() const { return m_data.size(); }
        [[nodiscard]] std::size_t remaining() const { return m_data.size() - m_position; }

        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        std::vector<std::byte> release();

    private:
        void require(std::size_t size) const;

        std::vector<std::byte> m_data;
        std::size_t m_position = 0;
    };

} // namespace pngc
