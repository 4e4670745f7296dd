/**
 * @file datastream.hh
 * @brief Reading and writing complete PNG datastreams
 * @author Igor
 * @date 20/08/2025
 */

#pragma once

#include <cstddef>
#include <iosfwd>
#include <vector>
#include <pngc/export_pngc.h>
#include <pngc/chunk_iterator.hh>
#include <pngc/chunk_list.hh>
#include <pngc/chunk_type_table.hh>
#include <pngc/parse_options.hh>

namespace pngc {

    /**
     * @brief Decode a datastream into a chunk list
     *
     * Checks the signature, then decodes every record in stream order
     * against the chunks decoded before it. Registered types are created
     * from the table; unregistered critical types are fatal, unregistered
     * ancillary types are skipped with an "unknown_chunk" warning.
     * Decoding stops after IEND.
     *
     * In strict mode a CRC mismatch, data after IEND and a missing IEND are
     * parse errors; otherwise they are reported as "crc_mismatch",
     * "trailing_data" and "missing_end" warnings.
     *
     * @param stream Seekable input stream positioned at the signature
     * @param table Chunk types to recognise
     * @param options Strictness and warning sink
     * @return The decoded chunks; any error aborts the whole decode
     */
    PNGC_EXPORT chunk_list decode(std::istream& stream,
                                  const chunk_type_table& table = chunk_type_table::defaults(),
                                  const parse_options& options = {});

    /**
     * @brief Decode a datastream held in memory
     */
    PNGC_EXPORT chunk_list decode(const std::vector<std::byte>& data,
                                  const chunk_type_table& table = chunk_type_table::defaults(),
                                  const parse_options& options = {});

    /**
     * @brief Write the signature and every chunk in write order
     *
     * Chunks whose use_chunk() is false are left out; the rest are ordered
     * by sequence(), ties in list order. A body longer than 2^31 - 1 bytes
     * is a parse_error.
     */
    PNGC_EXPORT void encode(std::ostream& stream, const chunk_list& chunks);

    PNGC_EXPORT std::vector<std::byte> encode(const chunk_list& chunks);

    /**
     * @brief Concatenation of all IDAT bodies in list order
     */
    PNGC_EXPORT std::vector<std::byte> image_data(const chunk_list& chunks);

    /**
     * @brief CRC-32 of a record: type name followed by body
     */
    PNGC_EXPORT std::uint32_t record_crc(fourcc type, const std::vector<std::byte>& body);

    /**
     * @brief Call func for every record without decoding the bodies
     *
     * @tparam Func Callable type accepting chunk_iterator::chunk_info&
     * @param stream Input stream containing a PNG datastream
     * @param func Function to call for each record
     * @param options Parse options for controlling the walk
     */
    template<typename Func>
    void for_each_chunk(std::istream& stream, Func func, const parse_options& options) {
        auto it = chunk_iterator::get_iterator(stream, options);

        while (it->has_next()) {
            func(it->current());
            it->next();
        }
    }

    template<typename Func>
    void for_each_chunk(std::istream& stream, Func func) {
        for_each_chunk(stream, func, parse_options{});
    }

} // namespace pngc
