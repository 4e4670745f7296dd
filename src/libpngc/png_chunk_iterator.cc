//
// Created by igor on 13/08/2025.
//

#include "png_chunk_iterator.hh"
#include <pngc/exceptions.hh>
#include "input.hh"
#include "png_chunk_reader.hh"

namespace pngc {

    // length + type before the body, CRC after it
    static constexpr std::uint64_t record_prefix_size = 8;
    static constexpr std::uint64_t record_overhead = 12;

    png_chunk_iterator::png_chunk_iterator(std::istream& stream)
        : png_chunk_iterator(stream, parse_options{}) {
    }

    png_chunk_iterator::png_chunk_iterator(std::istream& stream, const parse_options& options)
        : chunk_iterator(options)
        , m_reader(std::make_unique<reader>(stream)) {
        m_stream_size = m_reader->size();
        THROW_PARSE_IF(m_stream_size - m_reader->tell() < png_signature.size(),
                       "Not a PNG datastream: too short for the signature");

        auto magic = m_reader->read_exact(png_signature.size());
        for (std::size_t i = 0; i < png_signature.size(); i++) {
            THROW_PARSE_IF(static_cast<unsigned char>(magic[i]) != png_signature[i],
                           "Not a PNG datastream: signature mismatch at byte ", i);
        }

        m_ended = !read_next_chunk();
    }

    png_chunk_iterator::~png_chunk_iterator() = default;

    void png_chunk_iterator::advance() {
        if (m_ended) {
            return;
        }

        m_current.reader.reset();

        std::uint64_t next_pos = m_current.header.file_offset + record_overhead + m_current.header.size;
        m_reader->seek(next_pos, reader_base::set);

        m_index++;
        if (!read_next_chunk()) {
            m_ended = true;
        }
    }

    bool png_chunk_iterator::read_next_chunk() {
        std::uint64_t start_pos = m_reader->tell();
        if (start_pos >= m_stream_size) {
            return false;
        }

        THROW_IO_IF(m_stream_size - start_pos < record_overhead,
                    "Truncated record at offset ", start_pos, ": ", m_stream_size - start_pos,
                    " bytes left, a record needs at least ", record_overhead);

        std::uint32_t chunk_size = m_reader->read_u32be();
        fourcc chunk_id = m_reader->read_fourcc();

        THROW_PARSE_IF(chunk_size > max_format_chunk_size,
                       "Chunk ", chunk_id, " at offset ", start_pos, " declares length ", chunk_size,
                       ", above the format limit of ", max_format_chunk_size);

        THROW_PARSE_IF(!chunk_id.is_valid_chunk_name(),
                       "Invalid chunk type ", chunk_id, " at offset ", start_pos);

        THROW_IO_IF(start_pos + record_overhead + chunk_size > m_stream_size,
                    "Truncated chunk ", chunk_id, " at offset ", start_pos, ": declares ", chunk_size,
                    " body bytes, stream ends ", m_stream_size - start_pos - record_overhead, " bytes later");

        if (chunk_size > m_options.max_chunk_size) {
            if (m_options.strict) {
                THROW_PARSE("Chunk ", chunk_id, " at offset ", start_pos, " has size ", chunk_size,
                            " bytes, which exceeds maximum allowed size of ",
                            m_options.max_chunk_size, " bytes");
            }
            if (m_options.on_warning) {
                m_options.on_warning(start_pos, "size_limit",
                    build_error_msg("Chunk ", chunk_id, " size ", chunk_size, " exceeds maximum ",
                                    m_options.max_chunk_size, ", skipping"));
            }
            m_reader->seek(start_pos + record_overhead + chunk_size, reader_base::set);
            m_index++;
            return read_next_chunk();
        }

        // The CRC follows the body; fetch it now so the body reader can stay bounded
        std::uint64_t body_pos = start_pos + record_prefix_size;
        m_reader->seek(body_pos + chunk_size, reader_base::set);
        std::uint32_t crc = m_reader->read_u32be();
        m_reader->seek(body_pos, reader_base::set);

        m_current.header = {
            .id = chunk_id,
            .size = chunk_size,
            .file_offset = start_pos,
            .crc = crc
        };
        m_current.index = m_index;

        auto body = m_reader->create_subreader(chunk_size);
        m_current.reader = std::make_unique<png_chunk_reader>(std::move(body), chunk_size);
        return true;
    }

} // namespace pngc
