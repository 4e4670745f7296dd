#include <doctest/doctest.h>
#include <pngc/datastream.hh>
#include <pngc/chunks/header.hh>
#include <pngc/chunks/palette.hh>
#include <pngc/chunks/histogram.hh>
#include <pngc/chunks/image_data.hh>
#include <pngc/chunks/text.hh>
#include <pngc/chunks/structured_data.hh>
#include <pngc/chunks/color_space.hh>
#include <sstream>
#include "test_utils.hh"

using namespace pngc;

TEST_CASE("decoding a minimal datastream") {
    png_builder png;
    png.header(4, 3, 8, 6).idat(bytes_of({0x78, 0x9C})).end();

    auto chunks = decode(png.bytes());
    REQUIRE(chunks.size() == 3);
    CHECK(chunks[0].type() == "IHDR"_4cc);
    CHECK(chunks[1].type() == "IDAT"_4cc);
    CHECK(chunks[2].type() == "IEND"_4cc);

    const auto* header = chunks.first_of<header_chunk>();
    REQUIRE(header);
    CHECK(header->width() == 4);
    CHECK(header->height() == 3);
    CHECK(image_data(chunks) == bytes_of({0x78, 0x9C}));
}

TEST_CASE("decoding from a stream") {
    png_builder png;
    png.header().chunk("tEXt", bytes_of({'K', 0, 'v'})).idat().end();

    std::istringstream stream(png.str());
    auto chunks = decode(stream);
    CHECK(chunks.size() == 4);
    CHECK(chunks.first_of<text_chunk>()->text() == "v");
}

TEST_CASE("signature") {
    SUBCASE("wrong bytes") {
        png_builder png(false);
        png.raw(bytes_of({0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, 0x0B}));
        png.header().end();
        CHECK_THROWS_AS(decode(png.bytes()), parse_error);
    }

    SUBCASE("too short") {
        CHECK_THROWS_AS(decode(bytes_of({0x89, 'P', 'N'})), parse_error);
    }

    SUBCASE("empty") {
        CHECK_THROWS_AS(decode(std::vector<std::byte>{}), parse_error);
    }
}

TEST_CASE("unknown chunk types") {
    SUBCASE("ancillary chunks are skipped") {
        png_builder png;
        png.header().chunk("prVt", bytes_of({1, 2, 3})).idat().end();

        warning_tracker tracker;
        parse_options opts;
        opts.on_warning = std::ref(tracker);

        auto chunks = decode(png.bytes(), chunk_type_table::defaults(), opts);
        CHECK(chunks.size() == 3);
        CHECK_FALSE(chunks.contains("prVt"));
        CHECK(tracker.count_category("unknown_chunk") == 1);
    }

    SUBCASE("critical chunks stop the decoder") {
        png_builder png;
        png.header().chunk("CrIT", bytes_of({1})).idat().end();
        CHECK_THROWS_AS(decode(png.bytes()), unknown_critical_chunk);
        CHECK_THROWS_AS(decode(png.bytes(), chunk_type_table::defaults(), lenient()), unknown_critical_chunk);
    }

    SUBCASE("a table without stRT skips it") {
        chunk_type_table table;
        register_standard_types(table);

        chunk_list source;
        source.emplace<header_chunk>();
        source.emplace<structured_data_chunk>().set_data_type("DATA");
        source.emplace<image_data_chunk>();
        source.emplace<end_chunk>();
        auto bytes = encode(source);

        CHECK(decode(bytes).contains("stRT"));
        CHECK_FALSE(decode(bytes, table).contains("stRT"));
    }
}

TEST_CASE("CRC verification") {
    png_builder png;
    png.header().chunk_with_crc("IDAT", bytes_of({1, 2, 3}), 0xDEADBEEF).end();

    SUBCASE("strict") {
        CHECK_THROWS_AS(decode(png.bytes()), parse_error);
    }

    SUBCASE("lenient") {
        warning_tracker tracker;
        auto opts = lenient();
        opts.on_warning = std::ref(tracker);
        auto chunks = decode(png.bytes(), chunk_type_table::defaults(), opts);
        CHECK(chunks.size() == 3);
        CHECK(tracker.count_category("crc_mismatch") == 1);
    }

    SUBCASE("disabled") {
        parse_options opts;
        opts.verify_crc = false;
        CHECK_NOTHROW(decode(png.bytes(), chunk_type_table::defaults(), opts));
    }

    SUBCASE("known value") {
        CHECK(record_crc("IEND", {}) == 0xAE426082u);
    }
}

TEST_CASE("end of the datastream") {
    SUBCASE("missing IEND") {
        png_builder png;
        png.header().idat();
        CHECK_THROWS_AS(decode(png.bytes()), parse_error);

        warning_tracker tracker;
        auto opts = lenient();
        opts.on_warning = std::ref(tracker);
        auto chunks = decode(png.bytes(), chunk_type_table::defaults(), opts);
        CHECK(chunks.size() == 2);
        CHECK(tracker.has_warning("missing_end"));
    }

    SUBCASE("trailing data") {
        png_builder png;
        png.header().idat().end().raw(bytes_of("junk"));
        CHECK_THROWS_AS(decode(png.bytes()), parse_error);

        warning_tracker tracker;
        auto opts = lenient();
        opts.on_warning = std::ref(tracker);
        auto chunks = decode(png.bytes(), chunk_type_table::defaults(), opts);
        CHECK(chunks.size() == 3);
        CHECK(tracker.has_warning("trailing_data"));
    }

    SUBCASE("records after IEND are not decoded") {
        png_builder png;
        png.header().idat().end().chunk("tEXt", bytes_of({'K', 0}));

        auto chunks = decode(png.bytes(), chunk_type_table::defaults(), lenient());
        CHECK_FALSE(chunks.contains("tEXt"));
    }

    SUBCASE("truncated record") {
        png_builder png;
        png.header().raw(bytes_of({0, 0, 0, 10, 'I', 'D', 'A', 'T', 1, 2}));
        CHECK_THROWS_AS(decode(png.bytes()), io_error);
    }
}

TEST_CASE("ordering") {
    SUBCASE("IHDR must be first") {
        png_builder png;
        png.chunk("tEXt", bytes_of({'K', 0})).header().end();
        // tEXt itself needs the header
        CHECK_THROWS_AS(decode(png.bytes()), missing_dependency);
    }

    SUBCASE("palette after image data") {
        png_builder png;
        png.header(1, 1, 8, 3).idat().chunk("PLTE", plte_body(256)).end();
        CHECK_THROWS_AS(decode(png.bytes()), order_violation);

        warning_tracker tracker;
        auto opts = lenient();
        opts.on_warning = std::ref(tracker);
        auto chunks = decode(png.bytes(), chunk_type_table::defaults(), opts);
        CHECK(chunks.contains("PLTE"));
        CHECK(tracker.has_warning("order"));
    }

    SUBCASE("duplicate singleton") {
        png_builder png;
        png.header().chunk("gAMA", bytes_of({0, 0, 0, 1})).chunk("gAMA", bytes_of({0, 0, 0, 2})).end();
        CHECK_THROWS_AS(decode(png.bytes()), duplicate_chunk);
    }

    SUBCASE("any error aborts the decode") {
        png_builder png;
        png.header().chunk("stRT", bytes_of({'A', 'B'})).end();
        CHECK_THROWS_AS(decode(png.bytes(), chunk_type_table::defaults(), lenient()), malformed_length);
    }
}

TEST_CASE("encoding") {
    chunk_list chunks;
    chunks.emplace<end_chunk>();
    chunks.emplace<text_chunk>("Software", "pngc");
    chunks.emplace<image_data_chunk>(bytes_of({1, 2}));
    auto& header = chunks.emplace<header_chunk>();
    header.set_width(2);
    header.set_height(2);
    header.set_format(color_type::indexed, 1);
    auto& palette = chunks.emplace<palette_chunk>();
    palette.set_colors({{0, 0, 0}, {255, 255, 255}});
    chunks.emplace<histogram_chunk>();

    auto bytes = encode(chunks);

    SUBCASE("starts with the signature") {
        REQUIRE(bytes.size() > 8);
        for (std::size_t i = 0; i < png_signature.size(); i++) {
            CHECK(bytes[i] == static_cast<std::byte>(png_signature[i]));
        }
    }

    SUBCASE("writes in sequence order and drops empty chunks") {
        auto decoded = decode(bytes);
        REQUIRE(decoded.size() == 5);
        CHECK(decoded[0].type() == "IHDR"_4cc);
        CHECK(decoded[1].type() == "PLTE"_4cc);
        CHECK(decoded[2].type() == "IDAT"_4cc);
        CHECK(decoded[3].type() == "tEXt"_4cc);
        CHECK(decoded[4].type() == "IEND"_4cc);
        CHECK_FALSE(decoded.contains("hIST"));
    }

    SUBCASE("encode of the decoded list is identical") {
        CHECK(encode(decode(bytes)) == bytes);
    }

    SUBCASE("stream output matches") {
        std::ostringstream os;
        encode(os, chunks);
        auto text = os.str();
        CHECK(text.size() == bytes.size());
        CHECK(std::equal(text.begin(), text.end(), bytes.begin(),
                         [](char c, std::byte b) { return static_cast<std::byte>(c) == b; }));
    }
}

TEST_CASE("chunks without an encoder") {
    class opaque_chunk : public chunk {
    public:
        opaque_chunk() : chunk("opAQ") {}
    };

    chunk_list chunks;
    chunks.emplace<header_chunk>();
    chunks.emplace<opaque_chunk>();
    CHECK_THROWS_AS(encode(chunks), unimplemented_encode);
}

TEST_CASE("structured data through a whole datastream") {
    chunk_list chunks;
    chunks.emplace<header_chunk>();
    auto& data = chunks.emplace<structured_data_chunk>();
    data.set_data_type("DIFF");
    data.set_major_version(2);
    data.set_content({{"changed", 42}});
    chunks.emplace<image_data_chunk>();
    chunks.emplace<end_chunk>();

    auto decoded = decode(encode(chunks));
    const auto* strt = decoded.first_of<structured_data_chunk>();
    REQUIRE(strt);
    CHECK(strt->data_type() == "DIFF");
    CHECK(strt->major_version() == 2);
    CHECK(strt->content()["changed"] == 42);
}

TEST_CASE("for_each_chunk walks records without decoding") {
    png_builder png;
    png.header().chunk("CrIT", bytes_of({1})).idat().end();

    std::istringstream stream(png.str());
    std::vector<fourcc> names;
    for_each_chunk(stream, [&names](chunk_iterator::chunk_info& info) {
        names.push_back(info.header.id);
    });

    REQUIRE(names.size() == 4);
    CHECK(names[1] == "CrIT"_4cc);
}
