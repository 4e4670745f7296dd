/**
 * @file parse_options.hh
 * @brief Decoding options and configuration for PNG datastreams
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngc {

    /// Largest body length the container format can express (2^31 - 1)
    inline constexpr std::uint32_t max_format_chunk_size = 0x7FFFFFFFu;

    /**
     * @struct parse_options
     * @brief Configuration options for decoding PNG datastreams
     *
     * Controls strictness, checksum verification, size limits
     * and warning handling.
     */
    struct parse_options {
        /**
         * @brief Strict decoding mode
         *
         * When true, structural deviations (ordering, fixed lengths,
         * field ranges, checksums, trailing data) are fatal.
         * When false, they are reported through on_warning and decoding
         * continues. Each chunk type documents which of its checks
         * depend on this flag.
         */
        bool strict = true;

        /**
         * @brief Verify the CRC-32 of every record
         */
        bool verify_crc = true;

        /**
         * @brief Maximum accepted chunk body size in bytes
         *
         * Larger chunks are an error in strict mode and are skipped
         * with a "size_limit" warning otherwise. Lengths beyond
         * max_format_chunk_size are always fatal.
         */
        std::uint32_t max_chunk_size = max_format_chunk_size;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset of the record the warning refers to
         * @param category Warning category (e.g., "unknown_chunk", "crc_mismatch")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during decoding.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngc
