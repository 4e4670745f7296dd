//
// Created by igor on 13/08/2025.
//

#include "png_chunk_reader.hh"
#include "input.hh"
#include <algorithm>

namespace pngc {

    png_chunk_reader::png_chunk_reader(std::unique_ptr<subreader> reader, std::uint64_t chunk_size)
        : m_reader(std::move(reader))
        , m_chunk_size(chunk_size)
        , m_bytes_read(0) {
    }

    std::size_t png_chunk_reader::read(void* dst, std::size_t size) {
        if (!m_reader || !dst || size == 0) {
            return 0;
        }

        std::uint64_t available = m_chunk_size - m_bytes_read;
        if (available == 0) {
            return 0;
        }

        size = static_cast<std::size_t>(std::min<std::uint64_t>(size, available));

        // io_error from the stream propagates; a short count means EOF
        std::size_t actual = m_reader->read(dst, size);
        m_bytes_read += actual;
        return actual;
    }

    bool png_chunk_reader::skip(std::size_t size) {
        if (!m_reader) {
            return false;
        }

        std::uint64_t available = m_chunk_size - m_bytes_read;
        if (size > available) {
            return false;
        }

        m_reader->seek(m_reader->tell() + size, reader_base::set);
        m_bytes_read += size;
        return true;
    }

    std::uint64_t png_chunk_reader::remaining() const {
        if (!m_reader) {
            return 0;
        }
        return m_chunk_size - m_bytes_read;
    }

    std::uint64_t png_chunk_reader::offset() const {
        return m_bytes_read;
    }

    std::uint64_t png_chunk_reader::size() const {
        return m_chunk_size;
    }

} // namespace pngc
