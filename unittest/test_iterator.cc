#include <doctest/doctest.h>
#include <pngc/chunk_iterator.hh>
#include <pngc/exceptions.hh>
#include <sstream>
#include "test_utils.hh"

using namespace pngc;

TEST_CASE("chunk iterator walks records") {
    png_builder png;
    png.header().chunk("tEXt", bytes_of({'K', 0, 'a', 'b'})).idat(bytes_of({9, 8})).end();

    std::istringstream stream(png.str());
    auto it = chunk_iterator::get_iterator(stream);

    std::vector<chunk_header> headers;
    while (it->has_next()) {
        headers.push_back(it->current().header);
        CHECK(it->current().index == headers.size() - 1);
        it->next();
    }
    CHECK(it->at_end());

    REQUIRE(headers.size() == 4);
    CHECK(headers[0].id == "IHDR"_4cc);
    CHECK(headers[0].size == 13);
    CHECK(headers[0].file_offset == 8);
    CHECK(headers[1].id == "tEXt"_4cc);
    CHECK(headers[1].file_offset == 8 + 12 + 13);
    CHECK(headers[1].crc == record_crc("tEXt", bytes_of({'K', 0, 'a', 'b'})));
    CHECK(headers[3].id == "IEND"_4cc);
    CHECK(headers[3].size == 0);
}

TEST_CASE("chunk reader is bounded to the body") {
    png_builder png;
    png.header().idat(bytes_of({1, 2, 3, 4, 5})).end();

    std::istringstream stream(png.str());
    auto it = chunk_iterator::get_iterator(stream);
    it->next();

    auto& info = it->current();
    REQUIRE(info.header.id == "IDAT"_4cc);
    REQUIRE(info.reader);
    CHECK(info.reader->size() == 5);

    std::byte first[2];
    CHECK(info.reader->read(first, 2) == 2);
    CHECK(first[0] == std::byte{1});
    CHECK(info.reader->remaining() == 3);
    CHECK(info.reader->skip(1));
    CHECK(info.reader->read_all() == bytes_of({4, 5}));

    // Skipping the rest of a partially read body still lands on the next record
    it->next();
    CHECK(it->current().header.id == "IEND"_4cc);
}

TEST_CASE("chunk iterator framing errors") {
    SUBCASE("invalid type name") {
        png_builder png;
        png.header().chunk("ID1T", bytes_of({1}));
        std::istringstream stream(png.str());
        auto it = chunk_iterator::get_iterator(stream);
        CHECK_THROWS_AS(it->next(), parse_error);
    }

    SUBCASE("length above the format limit") {
        png_builder png;
        png.raw(bytes_of({0x80, 0, 0, 0, 'I', 'H', 'D', 'R', 0, 0, 0, 0}));
        std::istringstream stream(png.str());
        CHECK_THROWS_AS(chunk_iterator::get_iterator(stream), parse_error);
    }

    SUBCASE("body cut short") {
        png_builder png;
        png.raw(bytes_of({0, 0, 0, 13, 'I', 'H', 'D', 'R', 0, 0, 0, 0, 0, 0}));
        std::istringstream stream(png.str());
        CHECK_THROWS_AS(chunk_iterator::get_iterator(stream), io_error);
    }

    SUBCASE("signature only") {
        png_builder png;
        std::istringstream stream(png.str());
        auto it = chunk_iterator::get_iterator(stream);
        CHECK(it->at_end());
    }
}

TEST_CASE("chunk iterator size limit") {
    png_builder png;
    png.header().idat(std::vector<std::byte>(100)).end();

    SUBCASE("strict") {
        parse_options opts;
        opts.max_chunk_size = 50;
        std::istringstream stream(png.str());
        auto it = chunk_iterator::get_iterator(stream, opts);
        CHECK_THROWS_AS(it->next(), parse_error);
    }

    SUBCASE("lenient skips the record") {
        warning_tracker tracker;
        auto opts = lenient();
        opts.max_chunk_size = 50;
        opts.on_warning = std::ref(tracker);

        std::istringstream stream(png.str());
        auto it = chunk_iterator::get_iterator(stream, opts);
        it->next();
        CHECK(it->current().header.id == "IEND"_4cc);
        CHECK(tracker.count_category("size_limit") == 1);
    }
}
