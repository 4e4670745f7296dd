/**
 * @file color_space.hh
 * @brief Colour space chunks: cHRM, gAMA, iCCP, sBIT, sRGB
 * @author Igor
 * @date 18/08/2025
 *
 * All of them occur at most once and must precede PLTE and IDAT.
 */

#pragma once

#include <utility>
#include <cstdint>
#include <string>
#include <vector>
#include <pngc/chunk.hh>

namespace pngc {

    /**
     * @class gamma_chunk
     * @brief gAMA: image gamma times 100000
     */
    class PNGC_EXPORT gamma_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "gAMA"_4cc;
        static constexpr int default_sequence = 100;

        gamma_chunk();

        [[nodiscard]] std::uint32_t gamma_scaled() const { return m_gamma; }
        [[nodiscard]] double gamma() const { return m_gamma / 100000.0; }
        void set_gamma_scaled(std::uint32_t value) { m_gamma = value; }
        void set_gamma(double value);

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        std::uint32_t m_gamma = 45455;
    };

    /**
     * @struct chromaticity_point
     * @brief CIE x,y coordinates times 100000
     */
    struct chromaticity_point {
        std::uint32_t x = 0;
        std::uint32_t y = 0;

        bool operator==(const chromaticity_point& o) const { return x == o.x && y == o.y; }
    };

    /**
     * @class chromaticities_chunk
     * @brief cHRM: white point and primaries
     */
    class PNGC_EXPORT chromaticities_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "cHRM"_4cc;
        static constexpr int default_sequence = 100;
        static constexpr std::size_t body_size = 32;

        chromaticities_chunk();

        chromaticity_point white_point;
        chromaticity_point red;
        chromaticity_point green;
        chromaticity_point blue;

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;
    };

    /**
     * @enum rendering_intent
     * @brief sRGB rendering intents
     */
    enum class rendering_intent : std::uint8_t {
        perceptual            = 0,
        relative_colorimetric = 1,
        saturation            = 2,
        absolute_colorimetric = 3
    };

    /**
     * @class srgb_chunk
     * @brief sRGB: image samples conform to the sRGB colour space
     *
     * An intent above 3 is invalid_field in strict mode, a "field"
     * warning otherwise.
     */
    class PNGC_EXPORT srgb_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "sRGB"_4cc;
        static constexpr int default_sequence = 100;

        srgb_chunk();

        [[nodiscard]] rendering_intent intent() const { return m_intent; }
        void set_intent(rendering_intent intent) { m_intent = intent; }

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        rendering_intent m_intent = rendering_intent::perceptual;
    };

    /**
     * @class icc_profile_chunk
     * @brief iCCP: embedded, zlib-compressed ICC profile
     */
    class PNGC_EXPORT icc_profile_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "iCCP"_4cc;
        static constexpr int default_sequence = 100;

        icc_profile_chunk();

        [[nodiscard]] const std::string& profile_name() const { return m_name; }

        /**
         * @brief Throws invalid_field unless name is 1-79 bytes
         */
        void set_profile_name(const std::string& name);

        /// Uncompressed profile bytes
        [[nodiscard]] const std::vector<std::byte>& profile() const { return m_profile; }
        void set_profile(std::vector<std::byte> profile) { m_profile = std::move(profile); }

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        std::string m_name = "ICC profile";
        std::vector<std::byte> m_profile;
    };

    /**
     * @class significant_bits_chunk
     * @brief sBIT: original number of significant bits per channel
     *
     * The body has one byte per channel of the colour type
     * (grey 1, RGB 3, grey+alpha 2, RGBA 4; indexed images use 3).
     */
    class PNGC_EXPORT significant_bits_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "sBIT"_4cc;
        static constexpr int default_sequence = 100;

        significant_bits_chunk();

        [[nodiscard]] const std::vector<std::uint8_t>& bits() const { return m_bits; }
        void set_bits(std::vector<std::uint8_t> bits) { m_bits = std::move(bits); }

        [[nodiscard]] bool use_chunk() const override { return !m_bits.empty(); }

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        std::vector<std::uint8_t> m_bits;
    };

} // namespace pngc
