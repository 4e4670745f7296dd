//
// Created by igor on 18/08/2025.
//

#include <pngc/chunks/structured_data.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>
#include <pngc/compressor.hh>

namespace pngc {

    namespace {
        constexpr std::size_t prefix_size = 6;
        constexpr unsigned max_version = 255;
    }

    structured_data_chunk::structured_data_chunk()
        : chunk(type_name, default_sequence) {}

    void structured_data_chunk::set_data_type(const std::string& type) {
        THROW_CHUNK_IF(type.size() != 4, invalid_tag,
                       "Structured data type must have four characters, got \"", type, "\"");
        m_data_type = type;
    }

    void structured_data_chunk::set_major_version(unsigned value) {
        THROW_CHUNK_IF(value > max_version, version_out_of_range,
                       "Major version cannot be greater than ", max_version, ", got ", value);
        m_major = value;
    }

    void structured_data_chunk::set_minor_version(unsigned value) {
        THROW_CHUNK_IF(value > max_version, version_out_of_range,
                       "Minor version cannot be greater than ", max_version, ", got ", value);
        m_minor = value;
    }

    void structured_data_chunk::set_content(nlohmann::json content) {
        m_content = std::move(content);
    }

    void structured_data_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_unique(ctx);
        THROW_CHUNK_IF(length < prefix_size, malformed_length,
                       "stRT must have at least ", prefix_size, " bytes, got ", length);

        m_data_type = cursor.read_string(4);
        m_major = cursor.read_u8();
        m_minor = cursor.read_u8();
        auto packed = cursor.read_bytes(length - prefix_size);

        std::vector<std::byte> text;
        try {
            text = compressor().decompress(packed);
        } catch (const compression_error& e) {
            THROW_CHUNK(malformed_payload, "stRT payload of type \"", m_data_type,
                        "\" cannot be decompressed: ", e.what());
        }

        try {
            const auto* first = reinterpret_cast<const char*>(text.data());
            m_content = nlohmann::json::parse(first, first + text.size());
        } catch (const nlohmann::json::exception& e) {
            THROW_CHUNK(malformed_payload, "stRT payload of type \"", m_data_type,
                        "\" is not valid JSON: ", e.what());
        }
    }

    void structured_data_chunk::encode(byte_cursor& cursor) const {
        const std::string text = m_content.is_null() ? std::string("{}") : m_content.dump();
        const auto* first = reinterpret_cast<const std::byte*>(text.data());
        auto packed = compressor().compress(std::vector<std::byte>(first, first + text.size()));

        cursor.write_ascii(m_data_type);
        cursor.write_u8(static_cast<std::uint8_t>(m_major & 0xFF));
        cursor.write_u8(static_cast<std::uint8_t>(m_minor & 0xFF));
        cursor.write_bytes(packed);
    }

} // namespace pngc
