#include <doctest/doctest.h>
#include <pngc/chunks/header.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>
#include "test_utils.hh"

using namespace pngc;

namespace {
    void decode_header(header_chunk& header, const std::vector<std::byte>& body,
                       const chunk_list& siblings, const parse_options& opts = {}) {
        decode_context ctx(siblings, opts);
        byte_cursor cursor(body);
        header.decode(cursor, body.size(), ctx);
    }
}

TEST_CASE("IHDR decoding") {
    chunk_list siblings;

    SUBCASE("valid header") {
        header_chunk header;
        decode_header(header, ihdr_body(640, 480, 8, 3, 1), siblings);
        CHECK(header.width() == 640);
        CHECK(header.height() == 480);
        CHECK(header.bit_depth() == 8);
        CHECK(header.color_type() == color_type::indexed);
        CHECK(header.interlace_method() == 1);
        CHECK(header.has_palette());
        CHECK(header.allows_palette());
        CHECK(header.samples_per_pixel() == 1);
        CHECK(header.bits_per_pixel() == 8);
    }

    SUBCASE("wrong length") {
        header_chunk header;
        auto body = ihdr_body(1, 1, 8, 6);
        body.push_back(std::byte{0});
        CHECK_THROWS_AS(decode_header(header, body, siblings), malformed_length);
    }

    SUBCASE("zero width") {
        header_chunk header;
        CHECK_THROWS_AS(decode_header(header, ihdr_body(0, 1, 8, 6), siblings), invalid_field);
    }

    SUBCASE("invalid depth for color type") {
        header_chunk header;
        CHECK_THROWS_AS(decode_header(header, ihdr_body(1, 1, 16, 3), siblings), invalid_field);
        CHECK_THROWS_AS(decode_header(header, ihdr_body(1, 1, 4, 2), siblings), invalid_field);
        CHECK_THROWS_AS(decode_header(header, ihdr_body(1, 1, 8, 5), siblings), invalid_field);
    }

    SUBCASE("field checks do not depend on strictness") {
        header_chunk header;
        CHECK_THROWS_AS(decode_header(header, ihdr_body(1, 1, 8, 6, 2), siblings, lenient()), invalid_field);
    }

    SUBCASE("second header") {
        siblings.emplace<header_chunk>();
        header_chunk header;
        CHECK_THROWS_AS(decode_header(header, ihdr_body(1, 1, 8, 6), siblings), duplicate_chunk);
    }
}

TEST_CASE("IHDR colour type queries") {
    header_chunk header;

    header.set_format(color_type::grayscale, 16);
    CHECK_FALSE(header.has_color());
    CHECK_FALSE(header.has_alpha());
    CHECK_FALSE(header.allows_palette());
    CHECK(header.bits_per_pixel() == 16);

    header.set_format(color_type::truecolor, 8);
    CHECK(header.has_color());
    CHECK(header.allows_palette());
    CHECK_FALSE(header.has_palette());
    CHECK(header.samples_per_pixel() == 3);

    header.set_format(color_type::grayscale_alpha, 8);
    CHECK(header.has_alpha());
    CHECK(header.samples_per_pixel() == 2);

    header.set_format(color_type::truecolor_alpha, 16);
    CHECK(header.bits_per_pixel() == 64);

    CHECK_THROWS_AS(header.set_format(color_type::indexed, 16), invalid_field);
    CHECK(header_chunk::image_bytes_per_pixel() == 4);
}

TEST_CASE("IHDR encoding") {
    header_chunk header;
    header.set_width(300);
    header.set_height(200);
    header.set_format(color_type::indexed, 4);

    byte_cursor cursor;
    header.encode(cursor);
    CHECK(cursor.data() == ihdr_body(300, 200, 4, 3));
}
