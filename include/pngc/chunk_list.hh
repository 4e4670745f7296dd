/**
 * @file chunk_list.hh
 * @brief Ordered collection owning the chunks of one datastream
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>
#include <pngc/export_pngc.h>
#include <pngc/chunk.hh>

namespace pngc {

    /**
     * @class chunk_list
     * @brief Sole owner of a datastream's chunks
     *
     * Keeps chunks in insertion order (decode order, or the order the
     * caller appended them). The write order is computed separately by
     * write_order().
     */
    class PNGC_EXPORT chunk_list {
    public:
        using container = std::vector<std::unique_ptr<chunk>>;
        using const_iterator = container::const_iterator;

        chunk_list() = default;
        chunk_list(chunk_list&&) noexcept = default;
        chunk_list& operator=(chunk_list&&) noexcept = default;

        chunk& add(std::unique_ptr<chunk> c);

        template<typename T, typename... Args>
        T& emplace(Args&&... args) {
            auto owned = std::make_unique<T>(std::forward<Args>(args)...);
            T& ref = *owned;
            add(std::move(owned));
            return ref;
        }

        /**
         * @brief First chunk of the given type, or nullptr
         */
        [[nodiscard]] const chunk* first(fourcc type) const;
        [[nodiscard]] chunk* first(fourcc type);

        /**
         * @brief All chunks of the given type in insertion order
         */
        [[nodiscard]] std::vector<const chunk*> all(fourcc type) const;

        [[nodiscard]] bool contains(fourcc type) const { return first(type) != nullptr; }
        [[nodiscard]] std::size_t count(fourcc type) const;

        /**
         * @brief First chunk of T's registered type name, as T
         *
         * Returns nullptr when there is no such chunk or when the type name
         * was bound to a different class.
         */
        template<typename T>
        [[nodiscard]] const T* first_of() const {
            return dynamic_cast<const T*>(first(T::type_name));
        }

        template<typename T>
        [[nodiscard]] T* first_of() {
            return dynamic_cast<T*>(first(T::type_name));
        }

        template<typename T>
        [[nodiscard]] std::vector<const T*> all_of() const {
            std::vector<const T*> result;
            for (const chunk* c : all(T::type_name)) {
                if (auto* typed = dynamic_cast<const T*>(c)) {
                    result.push_back(typed);
                }
            }
            return result;
        }

        /**
         * @brief Chunks to be written, ordered by sequence()
         *
         * Chunks whose use_chunk() is false are left out. Ties keep their
         * insertion order.
         */
        [[nodiscard]] std::vector<const chunk*> write_order() const;

        [[nodiscard]] const chunk* back() const;

        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }
        [[nodiscard]] const chunk& operator[](std::size_t i) const { return *m_chunks[i]; }
        [[nodiscard]] chunk& operator[](std::size_t i) { return *m_chunks[i]; }

        [[nodiscard]] const_iterator begin() const { return m_chunks.begin(); }
        [[nodiscard]] const_iterator end() const { return m_chunks.end(); }

    private:
        container m_chunks;
    };

} // namespace pngc
