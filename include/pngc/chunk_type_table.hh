/**
 * @file chunk_type_table.hh
 * @brief Registry of chunk types keyed by their four character name
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>
#include <pngc/export_pngc.h>
#include <pngc/fourcc.hh>
#include <pngc/chunk.hh>

namespace pngc {

    /**
     * @typedef chunk_factory
     * @brief Creates a fresh, empty chunk of one type
     */
    using chunk_factory = std::function<std::unique_ptr<chunk>()>;

    /**
     * @struct chunk_type_entry
     * @brief Registration record of a chunk type
     */
    struct chunk_type_entry {
        fourcc name;            ///< Four character type name
        int sequence;           ///< Write-order priority given to created chunks
        chunk_factory factory;  ///< Produces the chunk implementation

        /// Big-endian integer view of name
        [[nodiscard]] std::uint32_t type_id() const { return name.type_id(); }
    };

    /**
     * @class chunk_type_table
     * @brief Maps chunk type names to their implementations
     *
     * A table is a plain value: decoders take it by reference, tests build
     * their own. defaults() holds the standard and custom types and is
     * built once on first use. Registering a name that already exists
     * replaces the previous entry.
     */
    class PNGC_EXPORT chunk_type_table {
    public:
        /**
         * @brief Register (or replace) a chunk type
         */
        void register_type(chunk_type_entry entry);

        /**
         * @brief Register chunk class T under T::type_name / T::default_sequence
         */
        template<typename T>
        void register_type() {
            register_type(chunk_type_entry{
                T::type_name,
                T::default_sequence,
                [] { return std::unique_ptr<chunk>(std::make_unique<T>()); }
            });
        }

        /**
         * @brief Find the entry for a type name
         * @return Entry or nullptr if the name is not registered
         */
        [[nodiscard]] const chunk_type_entry* lookup(fourcc name) const;

        [[nodiscard]] bool contains(fourcc name) const { return lookup(name) != nullptr; }

        /**
         * @brief Create a chunk bound to the registered type
         *
         * The created chunk takes the entry's sequence. Throws
         * unknown_chunk_type if name was never registered.
         */
        [[nodiscard]] std::unique_ptr<chunk> create(fourcc name) const;

        /**
         * @brief Registered names, sorted by sequence then name
         */
        [[nodiscard]] std::vector<fourcc> names() const;

        [[nodiscard]] std::size_t size() const { return m_entries.size(); }

        /**
         * @brief Process-wide table with every built-in type
         *
         * Built on first call by register_standard_types() followed by
         * register_custom_types(); never modified afterwards.
         */
        static const chunk_type_table& defaults();

    private:
        std::unordered_map<fourcc, chunk_type_entry> m_entries;
    };

    /**
     * @brief Register the chunk types defined by the PNG specification
     */
    PNGC_EXPORT void register_standard_types(chunk_type_table& table);

    /**
     * @brief Register the vendor extension types (structured data "stRT")
     */
    PNGC_EXPORT void register_custom_types(chunk_type_table& table);

} // namespace pngc
