//
// Created by igor on 20/08/2025.
//

#include <pngc/datastream.hh>
#include <pngc/byte_cursor.hh>
#include <pngc/exceptions.hh>
#include <pngc/chunks/image_data.hh>
#include <zlib.h>
#include <istream>
#include <ostream>
#include <sstream>

namespace pngc {

    namespace {
        constexpr std::uint64_t record_overhead = 12;

        std::uint64_t stream_size(std::istream& stream) {
            stream.clear();
            auto pos = stream.tellg();
            stream.seekg(0, std::ios_base::end);
            auto end = stream.tellg();
            THROW_IO_IF(pos == std::streampos(-1) || end == std::streampos(-1),
                        "Cannot determine the size of the input stream");
            stream.seekg(pos);
            return static_cast<std::uint64_t>(end);
        }

        void verify_crc(const chunk_header& header, const std::vector<std::byte>& body,
                        const parse_options& options) {
            if (!options.verify_crc) {
                return;
            }
            const auto actual = record_crc(header.id, body);
            if (actual == header.crc) {
                return;
            }

            auto msg = build_error_msg("CRC mismatch in chunk ", header.id, " at offset ", header.file_offset,
                                       ": stored 0x", std::hex, header.crc, ", computed 0x", actual);
            THROW_PARSE_IF(options.strict, msg);
            if (options.on_warning) {
                options.on_warning(header.file_offset, "crc_mismatch", msg);
            }
        }

        void decode_record(chunk_list& chunks, const chunk_type_table& table, const chunk_header& header,
                           std::vector<std::byte> body, const parse_options& options) {
            decode_context ctx(chunks, options, header.file_offset);
            byte_cursor cursor(std::move(body));

            if (!table.contains(header.id)) {
                // Critical: throws; ancillary: skipped and not kept
                chunk unknown(header.id);
                unknown.decode(cursor, header.size, ctx);
                return;
            }

            auto instance = table.create(header.id);
            instance->decode(cursor, header.size, ctx);
            chunks.add(std::move(instance));
        }
    }

    std::uint32_t record_crc(fourcc type, const std::vector<std::byte>& body) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(type.to_string_view().data()), 4);
        if (!body.empty()) {
            crc = crc32(crc, reinterpret_cast<const Bytef*>(body.data()), static_cast<uInt>(body.size()));
        }
        return static_cast<std::uint32_t>(crc);
    }

    chunk_list decode(std::istream& stream, const chunk_type_table& table, const parse_options& options) {
        chunk_list chunks;
        auto it = chunk_iterator::get_iterator(stream, options);

        bool ended = false;
        std::uint64_t end_offset = 0;
        while (it->has_next()) {
            auto& info = it->current();
            auto body = info.reader->read_all();
            verify_crc(info.header, body, options);
            decode_record(chunks, table, info.header, std::move(body), options);

            if (info.header.id == end_chunk::type_name) {
                ended = true;
                end_offset = info.header.file_offset + record_overhead + info.header.size;
                break;
            }
            it->next();
        }
        it.reset();

        const auto size = stream_size(stream);
        if (!ended) {
            THROW_PARSE_IF(options.strict, "Datastream ends without an IEND chunk");
            if (options.on_warning) {
                options.on_warning(size, "missing_end", "Datastream ends without an IEND chunk");
            }
        } else if (end_offset < size) {
            auto msg = build_error_msg(size - end_offset, " bytes of trailing data after IEND");
            THROW_PARSE_IF(options.strict, msg);
            if (options.on_warning) {
                options.on_warning(end_offset, "trailing_data", msg);
            }
        }
        return chunks;
    }

    chunk_list decode(const std::vector<std::byte>& data, const chunk_type_table& table,
                      const parse_options& options) {
        std::istringstream stream(std::string(reinterpret_cast<const char*>(data.data()), data.size()));
        return decode(stream, table, options);
    }

    void encode(std::ostream& stream, const chunk_list& chunks) {
        stream.write(reinterpret_cast<const char*>(png_signature.data()), png_signature.size());

        for (const chunk* c : chunks.write_order()) {
            byte_cursor body;
            c->encode(body);
            THROW_PARSE_IF(body.size() > max_format_chunk_size,
                           "Chunk ", c->type(), " body of ", body.size(), " bytes exceeds the format limit of ",
                           max_format_chunk_size);

            byte_cursor record;
            record.write_u32(static_cast<std::uint32_t>(body.size()));
            record.write_ascii(c->type().to_string_view());
            record.write_bytes(body.data());
            record.write_u32(record_crc(c->type(), body.data()));

            stream.write(reinterpret_cast<const char*>(record.data().data()),
                         static_cast<std::streamsize>(record.size()));
            THROW_IO_UNLESS(stream, "Failed to write chunk ", c->type());
        }
        THROW_IO_UNLESS(stream, "Failed to write the datastream");
    }

    std::vector<std::byte> encode(const chunk_list& chunks) {
        std::ostringstream stream;
        encode(stream, chunks);
        const auto text = stream.str();
        const auto* first = reinterpret_cast<const std::byte*>(text.data());
        return {first, first + text.size()};
    }

    std::vector<std::byte> image_data(const chunk_list& chunks) {
        std::vector<std::byte> result;
        for (const auto* idat : chunks.all_of<image_data_chunk>()) {
            result.insert(result.end(), idat->data().begin(), idat->data().end());
        }
        return result;
    }

} // namespace pngc
