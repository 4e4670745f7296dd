//
// Created by igor on 13/08/2025.
//

#pragma once

#include <pngc/chunk_reader.hh>
#include <memory>

namespace pngc {

    class subreader;

    // Reader over the body of one PNG record (CRC excluded)
    class png_chunk_reader : public chunk_reader {
    public:
        png_chunk_reader(std::unique_ptr<subreader> reader, std::uint64_t chunk_size);

        std::size_t read(void* dst, std::size_t size) override;
        bool skip(std::size_t size) override;

        std::uint64_t remaining() const override;
        std::uint64_t offset() const override;
        std::uint64_t size() const override;

    private:
        std::unique_ptr<subreader> m_reader;
        std::uint64_t m_chunk_size;
        std::uint64_t m_bytes_read;
    };

} // namespace pngc
