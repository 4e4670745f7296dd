//
// Created by igor on 14/08/2025.
//

#include <pngc/chunk_type_table.hh>
#include <pngc/exceptions.hh>
#include <pngc/chunks/header.hh>
#include <pngc/chunks/palette.hh>
#include <pngc/chunks/histogram.hh>
#include <pngc/chunks/image_data.hh>
#include <pngc/chunks/color_space.hh>
#include <pngc/chunks/transparency.hh>
#include <pngc/chunks/physical.hh>
#include <pngc/chunks/text.hh>
#include <pngc/chunks/structured_data.hh>
#include <algorithm>

namespace pngc {

    void chunk_type_table::register_type(chunk_type_entry entry) {
        auto name = entry.name;
        m_entries.insert_or_assign(name, std::move(entry));
    }

    const chunk_type_entry* chunk_type_table::lookup(fourcc name) const {
        auto it = m_entries.find(name);
        return it == m_entries.end() ? nullptr : &it->second;
    }

    std::unique_ptr<chunk> chunk_type_table::create(fourcc name) const {
        const auto* entry = lookup(name);
        THROW_CHUNK_UNLESS(entry, unknown_chunk_type, "Unknown chunk type ", name);
        THROW_CHUNK_UNLESS(entry->factory, unknown_chunk_type, "Chunk type ", name, " has no factory");

        auto instance = entry->factory();
        THROW_CHUNK_UNLESS(instance, unknown_chunk_type, "Factory for ", name, " returned no chunk");
        THROW_CHUNK_IF(instance->type() != name, unknown_chunk_type,
                       "Factory for ", name, " produced a ", instance->type(), " chunk");

        instance->m_sequence = entry->sequence;
        return instance;
    }

    std::vector<fourcc> chunk_type_table::names() const {
        std::vector<const chunk_type_entry*> entries;
        entries.reserve(m_entries.size());
        for (const auto& [name, entry] : m_entries) {
            entries.push_back(&entry);
        }

        std::sort(entries.begin(), entries.end(), [](const auto* a, const auto* b) {
            if (a->sequence != b->sequence) {
                return a->sequence < b->sequence;
            }
            return a->name < b->name;
        });

        std::vector<fourcc> result;
        result.reserve(entries.size());
        for (const auto* entry : entries) {
            result.push_back(entry->name);
        }
        return result;
    }

    const chunk_type_table& chunk_type_table::defaults() {
        static const chunk_type_table table = [] {
            chunk_type_table t;
            register_standard_types(t);
            register_custom_types(t);
            return t;
        }();
        return table;
    }

    void register_standard_types(chunk_type_table& table) {
        table.register_type<background_chunk>();
        table.register_type<chromaticities_chunk>();
        table.register_type<gamma_chunk>();
        table.register_type<histogram_chunk>();
        table.register_type<icc_profile_chunk>();
        table.register_type<image_data_chunk>();
        table.register_type<end_chunk>();
        table.register_type<header_chunk>();
        table.register_type<international_text_chunk>();
        table.register_type<physical_dimensions_chunk>();
        table.register_type<palette_chunk>();
        table.register_type<significant_bits_chunk>();
        table.register_type<suggested_palette_chunk>();
        table.register_type<srgb_chunk>();
        table.register_type<text_chunk>();
        table.register_type<time_chunk>();
        table.register_type<transparency_chunk>();
        table.register_type<compressed_text_chunk>();
    }

    void register_custom_types(chunk_type_table& table) {
        table.register_type<structured_data_chunk>();
    }

} // namespace pngc
