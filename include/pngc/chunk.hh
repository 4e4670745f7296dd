/**
 * @file chunk.hh
 * @brief Base class shared by every chunk type
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <pngc/export_pngc.h>
#include <pngc/fourcc.hh>
#include <pngc/exceptions.hh>
#include <pngc/parse_options.hh>

namespace pngc {

    class byte_cursor;
    class chunk_list;
    class chunk_type_table;
    class header_chunk;

    /**
     * @struct decode_context
     * @brief Everything a chunk decoder may consult besides its own body
     *
     * The sibling list holds the chunks decoded so far, in stream order.
     * It is a read-only view; the chunk being decoded is not part of it yet.
     */
    struct PNGC_EXPORT decode_context {
        const chunk_list& siblings;       ///< Chunks already decoded from the same datastream
        const parse_options& options;     ///< Strictness and warning sink
        std::uint64_t file_offset;        ///< Offset of the record in the input

        decode_context() = delete;

        decode_context(const chunk_list& s, const parse_options& o, std::uint64_t offset = 0)
            : siblings(s), options(o), file_offset(offset) {}

        [[nodiscard]] bool strict() const { return options.strict; }

        /**
         * @brief Forward a warning to parse_options::on_warning if set
         */
        void warn(std::string_view category, const std::string& message) const;

        /**
         * @brief Throw E in strict mode, otherwise report a warning
         * @tparam E chunk_error subclass to throw
         * @param category Warning category used in lenient mode
         */
        template<typename E, typename... Args>
        void violation(std::string_view category, Args&&... args) const {
            auto msg = build_error_msg(std::forward<Args>(args)...);
            if (strict()) {
                throw E(msg);
            }
            warn(category, msg);
        }
    };

    /**
     * @class chunk
     * @brief One typed record of a PNG datastream
     *
     * A chunk is bound to its type name and write-order sequence when it is
     * created. Concrete types override decode() and encode(); the base
     * implementation is what an unregistered type gets: critical chunks
     * cannot be decoded, ancillary chunks are skipped, nothing can be encoded.
     *
     * Sequence convention: 0 header, 100-600 metadata and data,
     * 750 unclassified (default), 1000 end marker.
     */
    class PNGC_EXPORT chunk {
    public:
        static constexpr int default_sequence = 750;

        explicit chunk(fourcc type, int sequence = default_sequence);
        virtual ~chunk() = default;

        chunk(const chunk&) = delete;
        chunk& operator=(const chunk&) = delete;

        [[nodiscard]] fourcc type() const { return m_type; }
        [[nodiscard]] std::uint32_t type_id() const { return m_type.type_id(); }
        [[nodiscard]] int sequence() const { return m_sequence; }

        /**
         * @brief Should the chunk be written at all?
         *
         * Types override this to drop themselves from the output when
         * their state is empty.
         */
        [[nodiscard]] virtual bool use_chunk() const { return true; }

        [[nodiscard]] bool is_critical() const { return pngc::is_critical(m_type); }
        [[nodiscard]] bool is_ancillary() const { return pngc::is_ancillary(m_type); }
        [[nodiscard]] bool is_public() const { return pngc::is_public(m_type); }
        [[nodiscard]] bool is_private() const { return pngc::is_private(m_type); }
        [[nodiscard]] bool is_safe_to_copy() const { return pngc::is_safe_to_copy(m_type); }
        [[nodiscard]] bool is_unsafe_to_copy() const { return pngc::is_unsafe_to_copy(m_type); }

        /**
         * @brief Decode the chunk body
         * @param cursor Cursor positioned at the first body byte
         * @param length Number of body bytes to consume
         * @param ctx Sibling chunks and decoding options
         */
        virtual void decode(byte_cursor& cursor, std::size_t length, const decode_context& ctx);

        /**
         * @brief Append the chunk body (without length, type and CRC) to cursor
         */
        virtual void encode(byte_cursor& cursor) const;

    protected:
        // Cross-chunk validation helpers for decode()

        /// duplicate_chunk if a chunk of this type was already decoded
        void require_unique(const decode_context& ctx) const;

        /// missing_dependency if no IHDR was decoded before this chunk
        const header_chunk& require_header(const decode_context& ctx) const;

        /// missing_dependency if no chunk of the given type precedes this one
        const chunk& require_predecessor(const decode_context& ctx, fourcc other) const;

        /// order_violation (strict) or "order" warning if other was already decoded
        void require_before(const decode_context& ctx, fourcc other) const;

        /// malformed_length unless length equals expected
        void require_length(std::size_t length, std::size_t expected) const;

    private:
        friend class chunk_type_table;

        fourcc m_type;
        int m_sequence;
    };

} // namespace pngc
