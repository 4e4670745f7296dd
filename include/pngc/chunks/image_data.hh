/**
 * @file image_data.hh
 * @brief IDAT - image data, IEND - image trailer
 * @author Igor
 * @date 17/08/2025
 */

#pragma once

#include <utility>
#include <vector>
#include <pngc/chunk.hh>

namespace pngc {

    /**
     * @class image_data_chunk
     * @brief IDAT: one slice of the compressed image data stream
     *
     * Bodies are kept verbatim; pixel decoding is outside this library.
     * Several IDAT chunks may occur; in strict mode they must be
     * consecutive.
     */
    class PNGC_EXPORT image_data_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "IDAT"_4cc;
        static constexpr int default_sequence = 500;

        image_data_chunk();
        explicit image_data_chunk(std::vector<std::byte> data);

        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        void set_data(std::vector<std::byte> data) { m_data = std::move(data); }

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;

    private:
        std::vector<std::byte> m_data;
    };

    /**
     * @class end_chunk
     * @brief IEND: marks the end of the datastream, empty body
     *
     * A non-empty body is malformed_length in strict mode; in lenient
     * mode the bytes are skipped with a "length" warning.
     */
    class PNGC_EXPORT end_chunk : public chunk {
    public:
        static constexpr fourcc type_name = "IEND"_4cc;
        static constexpr int default_sequence = 1000;

        end_chunk();

        void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx) override;
        void encode(byte_cursor& cursor) const override;
    };

} // namespace pngc
