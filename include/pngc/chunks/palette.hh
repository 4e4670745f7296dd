/**
 * @file palette.hh
 * @brief PLTE - palette
 * @author Igor
 * @date 17/08/2025
 */

#pragma once

#include <cstdint>
#include <vector>
#include <pngc/chunk.hh>

namespace pngc {

    /**
     * @struct rgb
     * @brief One palette entry
     */
    struct rgb {
        std::uint8_t r = 0;
        std::uint8_t g = 0;
        std::uint8_t b = 0;

        bool operator==(const rgb& o) const { return r == o.r && g == o.g && b == o.b; }
        bool operator!=(const rgb& o) const { return !(*this == o); }
    };

    /**
     * @class palette_chunk
     * @brief PLTE: up to 256 RGB entries, stored as 3 bytes each
     *
     * Decode requires IHDR, a colour type that permits a palette and a
     * body length divisible by 3. For indexed images the palette must have
     * at least 2^bit_depth entries; that check is fatal in strict mode and a
     * "palette_size" warning otherwise. PLTE must precede IDAT.
     */
    class PNGC_EXPORT palette_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "PLTE"_4cc;
        static constexpr int default_sequence = 250;

        palette_chunk();

        /**
         * @brief Colour at a palette index
         *
         * Throws index_out_of_range if index*3+3 exceeds the buffer.
         */
        [[nodiscard]] rgb color_at(std::size_t index) const;
        [[nodiscard]] std::size_t color_count() const { return m_palette.size() / 3; }

        void set_colors(const std::vector<rgb>& colors);
        void add_color(const rgb& color);

        [[nodiscard]] const std::vector<std::byte>& raw() const { return m_palette; }

        /**
         * @brief Expand palette indices to RGB
         * @param siblings Collection holding the IHDR that defines the output stride
         * @param input Palette indices, one per byte
         * @param input_offset First index to expand
         * @param count Number of indices to expand
         * @param image Output image (RGBA8)
         * @param image_offset Byte offset of the first output pixel
         *
         * Writes r, g, b of each pixel and leaves the remaining bytes of the
         * pixel untouched. Throws index_out_of_range for an index outside the
         * palette or a range outside input/image, missing_dependency
         * without IHDR.
         */
        void apply_to_image(const chunk_list& siblings,
                            const std::vector<std::byte>& input, std::size_t input_offset, std::size_t count,
                            std::vector<std::byte>& image, std::size_t image_offset) const;

        [[nodiscard]] bool use_chunk() const override { return !m_palette.empty(); }

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        std::vector<std::byte> m_palette;
    };

} // namespace pngc
