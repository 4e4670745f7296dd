//
// Created by igor on 12/08/2025.
//

#include <istream>
#include <algorithm>
#include <string>

#include "input.hh"

namespace pngc {
    // reader_base implementation
    std::unique_ptr<subreader> reader_base::create_subreader(std::size_t size) {
        std::uint64_t pos = tell();
        return std::make_unique<subreader>(this, pos, size);
    }

    fourcc reader_base::read_fourcc() {
        std::array<char, 4> data;
        std::size_t actual = read(data.data(), 4);
        THROW_IO_IF(actual != 4, "Failed to read chunk type");
        return fourcc(data[0], data[1], data[2], data[3]);
    }

    // reader implementation
    reader::reader(std::istream& is) : m_stream(is) {}

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        // A previous short read leaves eof set; only a bad stream is fatal
        if (m_stream.eof()) {
            return 0;
        }
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        return bytes_read;
    }

    void reader::seek(std::uint64_t offset, whence_t whence) {
        m_stream.clear();

        std::ios_base::seekdir dir;
        switch (whence) {
            case set:
                dir = std::ios_base::beg;
                break;
            case cur:
                dir = std::ios_base::cur;
                break;
            case end:
                dir = std::ios_base::end;
                break;
            default:
                THROW_IO("Invalid whence value: ", static_cast<int>(whence));
        }

        m_stream.seekg(static_cast<std::streamoff>(offset), dir);
        if (m_stream.fail()) {
            std::string error = "Cannot seek to offset " + std::to_string(offset);
            if (whence == reader_base::set) {
                error += " (absolute)";
            } else if (whence == reader_base::cur) {
                error += " (relative)";
            }
            THROW_IO(error);
        }
    }

    std::uint64_t reader::tell() const {
        std::streampos pos = m_stream.tellg();
        THROW_IO_IF(pos == std::streampos(-1), "Tell failed");
        return static_cast<std::uint64_t>(pos);
    }

    std::uint64_t reader::size() const {
        // Save current position
        std::streampos current_pos = m_stream.tellg();
        THROW_IO_IF(current_pos == std::streampos(-1), "Tell failed in size()");

        // Seek to end to get size
        m_stream.seekg(0, std::ios_base::end);
        std::streampos end_pos = m_stream.tellg();

        // Restore original position
        m_stream.seekg(current_pos);

        THROW_IO_IF(end_pos == std::streampos(-1), "Failed to get stream size");
        return static_cast<std::uint64_t>(end_pos);
    }

    // subreader implementation
    subreader::subreader(reader_base* parent, std::uint64_t start, std::size_t size)
        : m_parent(parent), m_start(start), m_size(size), m_position(0) {}

    std::size_t subreader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in subreader::read");

        if (size == 0) {
            return 0;
        }

        // Check how much we can read within our region
        std::size_t available = remaining();
        if (available == 0) {
            return 0;  // EOF-like behavior
        }

        size = std::min(size, available);

        // Seek parent to our current position
        m_parent->seek(m_start + m_position, reader_base::set);

        // Read from parent
        std::size_t actual = m_parent->read(dst, size);

        // Update our position
        m_position += actual;
        return actual;
    }

    void subreader::seek(std::uint64_t offset, whence_t whence) {
        std::uint64_t new_pos;

        switch (whence) {
            case set:
                new_pos = offset;
                break;
            case cur:
                new_pos = m_position + offset;
                break;
            case end:
                new_pos = m_size - offset;
                break;
            default:
                THROW_IO("Invalid whence value in subreader");
        }

        // Check bounds
        THROW_IO_IF(new_pos > m_size, "Seek beyond subreader bounds: ", new_pos, " > ", m_size);

        m_position = new_pos;
    }

    std::uint64_t subreader::tell() const {
        return m_position;
    }

    std::uint64_t subreader::size() const {
        return m_size;
    }

    std::size_t subreader::remaining() const {
        return m_size - m_position;
    }
}
