/**
 * @file structured_data.hh
 * @brief stRT - compressed JSON metadata (private extension chunk)
 * @author Igor
 * @date 18/08/2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include <pngc/chunk.hh>

namespace pngc {

    /**
     * @class structured_data_chunk
     * @brief stRT: typed, versioned JSON document
     *
     * Body layout:
     * - data type, 4 ASCII characters (sub-type of the content)
     * - major version, 1 byte
     * - minor version, 1 byte
     * - zlib-compressed UTF-8 JSON text
     *
     * At most one stRT chunk may occur in a datastream.
     */
    class PNGC_EXPORT structured_data_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "stRT"_4cc;
        static constexpr int default_sequence = 600;

        structured_data_chunk();

        [[nodiscard]] const std::string& data_type() const { return m_data_type; }

        /**
         * @brief Throws invalid_tag unless type has exactly four characters
         */
        void set_data_type(const std::string& type);

        [[nodiscard]] unsigned major_version() const { return m_major; }
        [[nodiscard]] unsigned minor_version() const { return m_minor; }

        /**
         * @brief Throws version_out_of_range above 255
         */
        void set_major_version(unsigned value);
        void set_minor_version(unsigned value);

        [[nodiscard]] const nlohmann::json& content() const { return m_content; }
        void set_content(nlohmann::json content);

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        std::string m_data_type = "    ";
        unsigned m_major = 0;
        unsigned m_minor = 0;
        nlohmann::json m_content;
    };

} // namespace pngc
