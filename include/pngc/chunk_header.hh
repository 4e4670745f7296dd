/**
 * @file chunk_header.hh
 * @brief Framing information of one PNG record
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <cstdint>
#include <pngc/fourcc.hh>

namespace pngc {

    /**
     * @struct chunk_header
     * @brief Header information for a record in a PNG datastream
     *
     * On disk a record is: length (u32 BE), type, body, CRC (u32 BE).
     */
    struct chunk_header {
        fourcc id;                         ///< Chunk type (4 characters)
        std::uint32_t size = 0;            ///< Body size in bytes
        std::uint64_t file_offset = 0;     ///< Absolute offset of the length field
        std::uint32_t crc = 0;             ///< Stored CRC-32 over type and body
    };

} // namespace pngc
