/**
 * @file histogram.hh
 * @brief hIST - palette histogram
 * @author Igor
 * @date 17/08/2025
 */

#pragma once

#include <cstdint>
#include <vector>
#include <pngc/chunk.hh>

namespace pngc {

    /**
     * @class histogram_chunk
     * @brief hIST: approximate usage frequency of each palette entry
     *
     * Frequencies are 16-bit big-endian values, one per palette entry.
     * Decode copies the body verbatim; the length is not checked against
     * the palette, reads are total instead. Without a preceding PLTE the
     * decode fails in strict mode and warns ("dependency") otherwise.
     */
    class PNGC_EXPORT histogram_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "hIST"_4cc;
        static constexpr int default_sequence = 350;

        histogram_chunk();

        /**
         * @brief Frequency of a palette index, 0 for any index outside the data
         */
        [[nodiscard]] std::uint16_t frequency(long long index) const;

        /**
         * @brief Set one frequency
         *
         * Resizes the data to the palette's colour count first, keeping the
         * values that still fit. Throws missing_dependency without a PLTE in
         * siblings and index_out_of_range if index is not a palette index.
         */
        void set_frequency(const chunk_list& siblings, std::size_t index, std::uint16_t value);

        /**
         * @brief Replace all frequencies
         */
        void set_frequencies(const std::vector<std::uint16_t>& values);

        [[nodiscard]] std::size_t frequency_count() const { return m_frequency.size() / 2; }
        [[nodiscard]] std::vector<std::uint16_t> frequencies() const;

        [[nodiscard]] bool use_chunk() const override { return !m_frequency.empty(); }

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        void write_at(std::size_t index, std::uint16_t value);

        std::vector<std::byte> m_frequency;
    };

} // namespace pngc
