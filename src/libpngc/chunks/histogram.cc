//
// Created by igor on 17/08/2025.
//

#include <pngc/chunks/histogram.hh>
#include <pngc/chunks/palette.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>

namespace pngc {

    histogram_chunk::histogram_chunk()
        : chunk(type_name, default_sequence) {}

    std::uint16_t histogram_chunk::frequency(long long index) const {
        if (index < 0) {
            return 0;
        }
        if (static_cast<unsigned long long>(index) >= frequency_count()) {
            return 0;
        }
        const auto pos = static_cast<std::size_t>(index) * 2;
        return static_cast<std::uint16_t>((std::to_integer<unsigned>(m_frequency[pos]) << 8) |
                                          std::to_integer<unsigned>(m_frequency[pos + 1]));
    }

    void histogram_chunk::write_at(std::size_t index, std::uint16_t value) {
        m_frequency[index * 2] = static_cast<std::byte>(value >> 8);
        m_frequency[index * 2 + 1] = static_cast<std::byte>(value & 0xFF);
    }

    void histogram_chunk::set_frequency(const chunk_list& siblings, std::size_t index, std::uint16_t value) {
        const auto* palette = siblings.first_of<palette_chunk>();
        THROW_CHUNK_UNLESS(palette, missing_dependency, "hIST requires a PLTE chunk");

        const std::size_t colors = palette->color_count();
        THROW_CHUNK_IF(index >= colors, index_out_of_range,
                       "Histogram index ", index, " out of range (", colors, " palette entries)");
        m_frequency.resize(colors * 2, std::byte{0});
        write_at(index, value);
    }

    void histogram_chunk::set_frequencies(const std::vector<std::uint16_t>& values) {
        m_frequency.assign(values.size() * 2, std::byte{0});
        for (std::size_t i = 0; i < values.size(); i++) {
            write_at(i, values[i]);
        }
    }

    std::vector<std::uint16_t> histogram_chunk::frequencies() const {
        std::vector<std::uint16_t> result;
        result.reserve(frequency_count());
        for (std::size_t i = 0; i < frequency_count(); i++) {
            result.push_back(frequency(static_cast<long long>(i)));
        }
        return result;
    }

    void histogram_chunk::decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) {
        require_header(ctx);
        require_unique(ctx);
        if (!ctx.siblings.contains(palette_chunk::type_name)) {
            ctx.violation<missing_dependency>("dependency", "hIST requires a preceding PLTE chunk");
        }
        require_before(ctx, "IDAT"_4cc);

        m_frequency = cursor.read_bytes(length);
    }

    void histogram_chunk::encode(byte_cursor& cursor) const {
        cursor.write_bytes(m_frequency);
    }

} // namespace pngc
