/**
 * @file text.hh
 * @brief Textual data chunks: tEXt, zTXt, iTXt, and tIME
 * @author Igor
 * @date 19/08/2025
 *
 * Keywords are 1-79 bytes of Latin-1. Any number of text chunks may
 * occur, in any position after IHDR.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <pngc/chunk.hh>

namespace pngc {

    /// Longest keyword the format allows
    inline constexpr std::size_t max_keyword_length = 79;

    /**
     * @class text_chunk
     * @brief tEXt: uncompressed Latin-1 keyword/text pair
     */
    class PNGC_EXPORT text_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "tEXt"_4cc;
        static constexpr int default_sequence = 750;

        text_chunk();
        text_chunk(const std::string& keyword, std::string text);

        [[nodiscard]] const std::string& keyword() const { return m_keyword; }

        /**
         * @brief Throws invalid_field unless keyword is 1-79 bytes
         */
        void set_keyword(const std::string& keyword);

        [[nodiscard]] const std::string& text() const { return m_text; }
        void set_text(std::string text) { m_text = std::move(text); }

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    protected:
        text_chunk(fourcc type, int sequence);

        std::string m_keyword = "Comment";
        std::string m_text;
    };

    /**
     * @class compressed_text_chunk
     * @brief zTXt: keyword with zlib-compressed Latin-1 text
     */
    class PNGC_EXPORT compressed_text_chunk : public text_chunk {
    public:
        static constexpr fourcc type_name = "zTXt"_4cc;
        static constexpr int default_sequence = 750;

        compressed_text_chunk();
        compressed_text_chunk(const std::string& keyword, std::string text);

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;
    };

    /**
     * @class international_text_chunk
     * @brief iTXt: UTF-8 text with language tag and translated keyword
     *
     * The text is optionally zlib-compressed.
     */
    class PNGC_EXPORT international_text_chunk : public text_chunk {
    public:
        static constexpr fourcc type_name = "iTXt"_4cc;
        static constexpr int default_sequence = 750;

        international_text_chunk();

        [[nodiscard]] bool compressed() const { return m_compressed; }
        void set_compressed(bool compressed) { m_compressed = compressed; }

        [[nodiscard]] const std::string& language_tag() const { return m_language; }
        void set_language_tag(std::string tag) { m_language = std::move(tag); }

        [[nodiscard]] const std::string& translated_keyword() const { return m_translated; }
        void set_translated_keyword(std::string keyword) { m_translated = std::move(keyword); }

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        bool m_compressed = false;
        std::string m_language;
        std::string m_translated;
    };

    /**
     * @class time_chunk
     * @brief tIME: time of the last image modification (UTC)
     *
     * Field ranges (month 1-12, day 1-31, hour 0-23, minute 0-59,
     * second 0-60) are invalid_field in strict mode and a "field" warning
     * otherwise.
     */
    class PNGC_EXPORT time_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "tIME"_4cc;
        static constexpr int default_sequence = 750;
        static constexpr std::size_t body_size = 7;

        time_chunk();

        std::uint16_t year = 1970;
        std::uint8_t month = 1;
        std::uint8_t day = 1;
        std::uint8_t hour = 0;
        std::uint8_t minute = 0;
        std::uint8_t second = 0;

        /// Fields are within their calendar ranges
        [[nodiscard]] bool is_valid() const;

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;
    };

} // namespace pngc
