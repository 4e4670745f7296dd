//
// Created by igor on 16/08/2025.
//

#include <pngc/chunk_list.hh>
#include <pngc/exceptions.hh>
#include <algorithm>

namespace pngc {

    chunk& chunk_list::add(std::unique_ptr<chunk> c) {
        if (!c) {
            throw pngc_error("Cannot add a null chunk");
        }
        m_chunks.push_back(std::move(c));
        return *m_chunks.back();
    }

    const chunk* chunk_list::first(fourcc type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [type](const auto& c) { return c->type() == type; });
        return it == m_chunks.end() ? nullptr : it->get();
    }

    chunk* chunk_list::first(fourcc type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
                               [type](const auto& c) { return c->type() == type; });
        return it == m_chunks.end() ? nullptr : it->get();
    }

    std::vector<const chunk*> chunk_list::all(fourcc type) const {
        std::vector<const chunk*> result;
        for (const auto& c : m_chunks) {
            if (c->type() == type) {
                result.push_back(c.get());
            }
        }
        return result;
    }

    std::size_t chunk_list::count(fourcc type) const {
        return static_cast<std::size_t>(std::count_if(m_chunks.begin(), m_chunks.end(),
                                        [type](const auto& c) { return c->type() == type; }));
    }

    std::vector<const chunk*> chunk_list::write_order() const {
        std::vector<const chunk*> result;
        result.reserve(m_chunks.size());
        for (const auto& c : m_chunks) {
            if (c->use_chunk()) {
                result.push_back(c.get());
            }
        }

        std::stable_sort(result.begin(), result.end(), [](const chunk* a, const chunk* b) {
            return a->sequence() < b->sequence();
        });
        return result;
    }

    const chunk* chunk_list::back() const {
        return m_chunks.empty() ? nullptr : m_chunks.back().get();
    }

} // namespace pngc
