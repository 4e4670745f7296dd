/**
 * @file header.hh
 * @brief IHDR - image header
 * @author Igor
 * @date 17/08/2025
 */

#pragma once

#include <cstdint>
#include <pngc/chunk.hh>

namespace pngc {

    /**
     * @enum color_type
     * @brief Colour types allowed in IHDR
     */
    enum class color_type : std::uint8_t {
        grayscale       = 0,
        truecolor       = 2,
        indexed         = 3,
        grayscale_alpha = 4,
        truecolor_alpha = 6
    };

    /**
     * @class header_chunk
     * @brief IHDR: image dimensions and sample layout
     *
     * Every other chunk type depends on it. It must be the first chunk of
     * a datastream (strict mode; lenient mode warns), occurs once and has a
     * 13-byte body. Field values are always validated.
     */
    class PNGC_EXPORT header_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "IHDR"_4cc;
        static constexpr int default_sequence = 0;
        static constexpr std::size_t body_size = 13;

        header_chunk();

        [[nodiscard]] std::uint32_t width() const { return m_width; }
        [[nodiscard]] std::uint32_t height() const { return m_height; }
        [[nodiscard]] std::uint8_t bit_depth() const { return m_bit_depth; }
        [[nodiscard]] pngc::color_type color_type() const { return m_color_type; }
        [[nodiscard]] std::uint8_t compression_method() const { return m_compression; }
        [[nodiscard]] std::uint8_t filter_method() const { return m_filter; }
        [[nodiscard]] std::uint8_t interlace_method() const { return m_interlace; }

        void set_width(std::uint32_t width);
        void set_height(std::uint32_t height);

        /**
         * @brief Set colour type and bit depth together
         *
         * Throws invalid_field for a combination the format does not allow.
         */
        void set_format(pngc::color_type type, std::uint8_t bit_depth);
        void set_interlace_method(std::uint8_t method);

        /// Colour type 3: samples are palette indices
        [[nodiscard]] bool has_palette() const;
        /// Colour types 2, 3, 6 may carry a PLTE chunk
        [[nodiscard]] bool allows_palette() const;
        [[nodiscard]] bool has_color() const;
        [[nodiscard]] bool has_alpha() const;

        /// Samples per pixel in the encoded image data
        [[nodiscard]] unsigned samples_per_pixel() const;
        [[nodiscard]] unsigned bits_per_pixel() const;

        /// Stride of the expanded RGBA8 output image
        [[nodiscard]] static constexpr unsigned image_bytes_per_pixel() { return 4; }

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

        /// True if the bit depth is allowed for the colour type
        [[nodiscard]] static bool is_valid_format(std::uint8_t type, std::uint8_t bit_depth);

    private:
        std::uint32_t m_width = 1;
        std::uint32_t m_height = 1;
        std::uint8_t m_bit_depth = 8;
        pngc::color_type m_color_type = pngc::color_type::truecolor_alpha;
        std::uint8_t m_compression = 0;
        std::uint8_t m_filter = 0;
        std::uint8_t m_interlace = 0;
    };

} // namespace pngc
