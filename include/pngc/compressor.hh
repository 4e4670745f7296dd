/**
 * @file compressor.hh
 * @brief zlib wrapper used for compressed chunk payloads
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <cstddef>
#include <vector>
#include <pngc/export_pngc.h>

namespace pngc {

    /**
     * @class compressor
     * @brief Deflate/inflate of whole buffers in zlib format
     *
     * This is compression method 0 of the PNG specification, used by
     * zTXt, iTXt, iCCP and the structured data chunk. Both operations
     * are deterministic and keep no state between calls.
     */
    class PNGC_EXPORT compressor {
    public:
        /**
         * @param level zlib compression level (-1 = zlib default, 0..9)
         */
        explicit compressor(int level = -1);

        [[nodiscard]] std::vector<std::byte> compress(const std::vector<std::byte>& data) const;

        /**
         * @brief Inflate a complete zlib stream
         *
         * Throws compression_error if the stream is corrupt, truncated
         * or followed by extra bytes.
         */
        [[nodiscard]] std::vector<std::byte> decompress(const std::vector<std::byte>& data) const;

    private:
        int m_level;
    };

} // namespace pngc
