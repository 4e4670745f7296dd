/**
 * @file physical.hh
 * @brief pHYs - physical pixel dimensions, sPLT - suggested palette
 * @author Igor
 * @date 18/08/2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <pngc/chunk.hh>

namespace pngc {

    /**
     * @class physical_dimensions_chunk
     * @brief pHYs: pixels per unit on each axis
     *
     * Unit 0 means the values only give the aspect ratio, unit 1 is
     * the metre. Must precede IDAT.
     */
    class PNGC_EXPORT physical_dimensions_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "pHYs"_4cc;
        static constexpr int default_sequence = 400;
        static constexpr std::size_t body_size = 9;

        enum unit_type : std::uint8_t {
            unknown = 0,
            metre = 1
        };

        physical_dimensions_chunk();

        std::uint32_t pixels_per_unit_x = 1;
        std::uint32_t pixels_per_unit_y = 1;
        unit_type unit = unknown;

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;
    };

    /**
     * @struct suggested_palette_entry
     * @brief One sPLT entry; samples are 8 or 16 bits wide
     */
    struct suggested_palette_entry {
        std::uint16_t red = 0;
        std::uint16_t green = 0;
        std::uint16_t blue = 0;
        std::uint16_t alpha = 0;
        std::uint16_t frequency = 0;

        bool operator==(const suggested_palette_entry& o) const {
            return red == o.red && green == o.green && blue == o.blue &&
                   alpha == o.alpha && frequency == o.frequency;
        }
    };

    /**
     * @class suggested_palette_chunk
     * @brief sPLT: named palette suggestion
     *
     * Several sPLT chunks may occur, but no two with the same name
     * (duplicate_chunk). Must precede IDAT.
     */
    class PNGC_EXPORT suggested_palette_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "sPLT"_4cc;
        static constexpr int default_sequence = 400;

        suggested_palette_chunk();

        [[nodiscard]] const std::string& name() const { return m_name; }
        void set_name(const std::string& name);

        [[nodiscard]] std::uint8_t sample_depth() const { return m_depth; }

        /**
         * @brief Throws invalid_field unless depth is 8 or 16
         */
        void set_sample_depth(std::uint8_t depth);

        std::vector<suggested_palette_entry> entries;

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        std::string m_name = "default";
        std::uint8_t m_depth = 8;
    };

} // namespace pngc
