/**
 * @file chunk_iterator.hh
 * @brief Sequential walk over the records of a PNG datastream
 * @author Igor
 * @date 13/08/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <pngc/fourcc.hh>
#include <pngc/chunk_header.hh>
#include <pngc/chunk_reader.hh>
#include <pngc/parse_options.hh>
#include <pngc/export_pngc.h>

namespace pngc {

    class reader_base;

    /// The eight bytes every PNG datastream starts with
    inline constexpr std::array<unsigned char, 8> png_signature = {
        0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'
    };

    /**
     * @class chunk_iterator
     * @brief Iterator over the framed records of a PNG datastream
     *
     * The signature is checked when the iterator is created. Each step
     * exposes the record header (including the stored CRC) and a reader
     * limited to the record body. Iteration ends at the end of the stream;
     * a record cut short by the end of the stream is an io_error.
     */
    class PNGC_EXPORT chunk_iterator {
    public:
        /**
         * @brief Create an iterator for a stream positioned at the signature
         * @param stream Seekable input stream
         * @return Unique pointer to the iterator
         *
         * Throws parse_error if the stream does not start with the PNG
         * signature.
         */
        static std::unique_ptr<chunk_iterator> get_iterator(std::istream& stream);

        /**
         * @brief Factory method with custom parse options
         */
        static std::unique_ptr<chunk_iterator> get_iterator(std::istream& stream, const parse_options& options);

        /**
         * @struct chunk_info
         * @brief Information about the current record
         */
        struct chunk_info {
            chunk_header header;                    ///< Header information for the current record
            std::unique_ptr<chunk_reader> reader;   ///< Reader for the body (nullptr if skipped)
            std::size_t index = 0;                  ///< Position of the record in the stream
        };

        virtual ~chunk_iterator() = default;

        const chunk_info& current() const { return m_current; }
        chunk_info& current() { return m_current; }

        /**
         * @brief Advance to the next record
         */
        void next() {
            advance();
        }

        bool has_next() const { return !m_ended; }
        bool at_end() const { return m_ended; }

    protected:
        chunk_iterator() : m_current{}, m_ended(true) {}
        explicit chunk_iterator(const parse_options& opts) : m_current{}, m_ended(true), m_options(opts) {}

        virtual void advance() = 0;

        chunk_info m_current;
        bool m_ended;
        parse_options m_options;
    };

} // namespace pngc
