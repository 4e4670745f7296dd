/**
 * @file chunk_reader.hh
 * @brief Abstract interface for reading the body of one record
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include <pngc/export_pngc.h>

namespace pngc {

    /**
     * @class chunk_reader
     * @brief Abstract interface for reading chunk data
     *
     * Reads are limited to the record body; the CRC that follows is
     * not visible through the reader.
     */
    class PNGC_EXPORT chunk_reader {
    public:
        /**
         * @brief Virtual destructor
         */
        virtual ~chunk_reader() = default;

        /**
         * @brief Read data from the chunk
         * @param dst Destination buffer
         * @param size Number of bytes to read
         * @return Number of bytes actually read
         */
        virtual std::size_t read(void* dst, std::size_t size) = 0;

        /**
         * @brief Skip bytes in the chunk
         * @param size Number of bytes to skip
         * @return True if skip was successful
         */
        virtual bool skip(std::size_t size) = 0;

        /**
         * @brief Get number of bytes remaining in chunk
         */
        virtual std::uint64_t remaining() const = 0;

        /**
         * @brief Get current offset within chunk
         */
        virtual std::uint64_t offset() const = 0;

        /**
         * @brief Get total chunk size
         */
        virtual std::uint64_t size() const = 0;

        /**
         * @brief Read a string of specified size
         * @return String if successful, nullopt on short read
         */
        virtual std::optional<std::string> read_string(std::size_t size);

        /**
         * @brief Read all remaining data in chunk
         *
         * Throws io_error if the underlying stream ends early.
         */
        virtual std::vector<std::byte> read_all();
    };

} // namespace pngc
