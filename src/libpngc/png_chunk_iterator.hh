//
// Created by igor on 13/08/2025.
//

#pragma once

#include <pngc/chunk_iterator.hh>
#include <memory>
#include <iosfwd>

namespace pngc {

    class reader_base;

    // PNG record iterator (internal implementation)
    class png_chunk_iterator : public chunk_iterator {
    public:
        explicit png_chunk_iterator(std::istream& stream);
        png_chunk_iterator(std::istream& stream, const parse_options& options);
        ~png_chunk_iterator() override;

    protected:
        void advance() override;

    private:
        // Read the record starting at the current position
        bool read_next_chunk();

        std::unique_ptr<reader_base> m_reader;
        std::uint64_t m_stream_size = 0;
        std::size_t m_index = 0;
    };

} // namespace pngc
