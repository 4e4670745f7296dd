/**
 * @file transparency.hh
 * @brief Chunks whose layout follows the colour type: tRNS, bKGD
 * @author Igor
 * @date 18/08/2025
 */

#pragma once

#include <cstdint>
#include <vector>
#include <pngc/chunk.hh>

namespace pngc {

    /**
     * @struct rgb16
     * @brief RGB sample triple at full 16-bit width
     */
    struct rgb16 {
        std::uint16_t r = 0;
        std::uint16_t g = 0;
        std::uint16_t b = 0;

        bool operator==(const rgb16& o) const { return r == o.r && g == o.g && b == o.b; }
    };

    /**
     * @enum sample_layout
     * @brief Which of the colour-type dependent layouts a chunk holds
     */
    enum class sample_layout {
        palette,   ///< Colour type 3: per-index data
        gray,      ///< Colour types 0 and 4: one 16-bit sample
        rgb        ///< Colour types 2 and 6: three 16-bit samples
    };

    /**
     * @class transparency_chunk
     * @brief tRNS: simple transparency
     *
     * Indexed images store one alpha byte per palette entry (at most as
     * many as the palette has); grey and truecolor images store a single
     * transparent colour. Not allowed for colour types 4 and 6.
     * Must precede IDAT.
     */
    class PNGC_EXPORT transparency_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "tRNS"_4cc;
        static constexpr int default_sequence = 300;

        transparency_chunk();

        [[nodiscard]] sample_layout layout() const { return m_layout; }

        /// Alpha of a palette entry; entries beyond the stored ones are opaque
        [[nodiscard]] std::uint8_t alpha_at(std::size_t index) const;
        [[nodiscard]] const std::vector<std::uint8_t>& palette_alpha() const { return m_alpha; }
        [[nodiscard]] std::uint16_t gray() const { return m_gray; }
        [[nodiscard]] const rgb16& color() const { return m_color; }

        void set_palette_alpha(std::vector<std::uint8_t> alpha);
        void set_gray(std::uint16_t gray);
        void set_color(const rgb16& color);

        [[nodiscard]] bool use_chunk() const override;

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        sample_layout m_layout = sample_layout::palette;
        std::vector<std::uint8_t> m_alpha;
        std::uint16_t m_gray = 0;
        rgb16 m_color;
    };

    /**
     * @class background_chunk
     * @brief bKGD: default background colour
     *
     * Indexed images store a palette index (requires PLTE); grey images a
     * 16-bit grey level; truecolor images an RGB triple. Must precede IDAT.
     */
    class PNGC_EXPORT background_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "bKGD"_4cc;
        static constexpr int default_sequence = 300;

        background_chunk();

        [[nodiscard]] sample_layout layout() const { return m_layout; }
        [[nodiscard]] std::uint8_t palette_index() const { return m_index; }
        [[nodiscard]] std::uint16_t gray() const { return m_gray; }
        [[nodiscard]] const rgb16& color() const { return m_color; }

        void set_palette_index(std::uint8_t index);
        void set_gray(std::uint16_t gray);
        void set_color(const rgb16& color);

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        sample_layout m_layout = sample_layout::rgb;
        std::uint8_t m_index = 0;
        std::uint16_t m_gray = 0;
        rgb16 m_color;
    };

} // namespace pngc
