//
// Created by igor on 16/08/2025.
//

#include <pngc/byte_cursor.hh>
#include <pngc/endian.hh>
#include <pngc/exceptions.hh>
#include <cstring>
#include <algorithm>

namespace pngc {

    byte_cursor::byte_cursor(std::vector<std::byte> data)
        : m_data(std::move(data)) {}

    void byte_cursor::require(std::size_t size) const {
        THROW_IO_IF(size > remaining(), "Unexpected end of chunk data: requested ", size,
                    " bytes at offset ", m_position, ", only ", remaining(), " available");
    }

    std::uint8_t byte_cursor::read_u8() {
        require(1);
        return static_cast<std::uint8_t>(m_data[m_position++]);
    }

    std::uint16_t byte_cursor::read_u16() {
        require(2);
        std::uint16_t value;
        std::memcpy(&value, m_data.data() + m_position, 2);
        m_position += 2;
        return swap16be(value);
    }

    std::uint32_t byte_cursor::read_u32() {
        require(4);
        std::uint32_t value;
        std::memcpy(&value, m_data.data() + m_position, 4);
        m_position += 4;
        return swap32be(value);
    }

    std::string byte_cursor::read_string(std::size_t size) {
        require(size);
        std::string result(reinterpret_cast<const char*>(m_data.data() + m_position), size);
        m_position += size;
        return result;
    }

    std::string byte_cursor::read_until_nul(std::size_t max_length) {
        auto begin = m_data.begin() + static_cast<std::ptrdiff_t>(m_position);
        auto limit = begin + static_cast<std::ptrdiff_t>(std::min(remaining(), max_length + 1));
        auto nul = std::find(begin, limit, std::byte{0});
        THROW_IO_IF(nul == limit, "Missing NUL separator within ", max_length,
                    " bytes at offset ", m_position);

        std::string result(reinterpret_cast<const char*>(m_data.data() + m_position),
                           static_cast<std::size_t>(nul - begin));
        m_position += result.size() + 1;
        return result;
    }

    std::vector<std::byte> byte_cursor::read_bytes(std::size_t size) {
        require(size);
        auto first = m_data.begin() + static_cast<std::ptrdiff_t>(m_position);
        std::vector<std::byte> result(first, first + static_cast<std::ptrdiff_t>(size));
        m_position += size;
        return result;
    }

    void byte_cursor::skip(std::size_t size) {
        require(size);
        m_position += size;
    }

    void byte_cursor::write_u8(std::uint8_t value) {
        m_data.push_back(static_cast<std::byte>(value));
    }

    void byte_cursor::write_u16(std::uint16_t value) {
        std::uint16_t be = swap16be(value);
        write_bytes(&be, 2);
    }

    void byte_cursor::write_u32(std::uint32_t value) {
        std::uint32_t be = swap32be(value);
        write_bytes(&be, 4);
    }

    void byte_cursor::write_ascii(std::string_view text) {
        write_bytes(text.data(), text.size());
    }

    void byte_cursor::write_bytes(const std::vector<std::byte>& bytes) {
        m_data.insert(m_data.end(), bytes.begin(), bytes.end());
    }

    void byte_cursor::write_bytes(const void* data, std::size_t size) {
        auto first = static_cast<const std::byte*>(data);
        m_data.insert(m_data.end(), first, first + size);
    }

    std::vector<std::byte> byte_cursor::release() {
        std::vector<std::byte> result = std::move(m_data);
        m_data.clear();
        m_position = 0;
        return result;
    }

} // namespace pngc
