#include <doctest/doctest.h>
#include <pngc/chunks/structured_data.hh>
#include <pngc/chunks/header.hh>
#include <pngc/chunks/image_data.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>
#include <pngc/compressor.hh>
#include "test_utils.hh"

using namespace pngc;

namespace {
    std::vector<std::byte> strt_body(std::string_view tag, unsigned major, unsigned minor,
                                     const std::vector<std::byte>& payload) {
        auto body = bytes_of(tag);
        body.push_back(static_cast<std::byte>(major));
        body.push_back(static_cast<std::byte>(minor));
        append(body, payload);
        return body;
    }

    void decode_strt(structured_data_chunk& c, const std::vector<std::byte>& body, const chunk_list& siblings) {
        parse_options opts;
        decode_context ctx(siblings, opts);
        byte_cursor cursor(body);
        c.decode(cursor, body.size(), ctx);
    }
}

TEST_CASE("stRT setters") {
    structured_data_chunk c;
    CHECK(c.data_type() == "    ");
    CHECK(c.major_version() == 0);
    CHECK(c.minor_version() == 0);

    c.set_data_type("TEST");
    CHECK(c.data_type() == "TEST");
    CHECK_THROWS_AS(c.set_data_type("ABC"), invalid_tag);
    CHECK_THROWS_AS(c.set_data_type("ABCDE"), invalid_tag);
    CHECK(c.data_type() == "TEST");

    c.set_major_version(255);
    c.set_minor_version(0);
    CHECK(c.major_version() == 255);
    CHECK_THROWS_AS(c.set_major_version(256), version_out_of_range);
    CHECK_THROWS_AS(c.set_minor_version(1000), version_out_of_range);
    CHECK(c.minor_version() == 0);
}

TEST_CASE("stRT encode and decode") {
    chunk_list siblings;

    SUBCASE("content survives a round trip") {
        structured_data_chunk out;
        out.set_data_type("RSLT");
        out.set_major_version(1);
        out.set_minor_version(2);
        out.set_content({{"name", "diff"}, {"pixels", 1234}, {"tags", {"a", "b"}}});

        byte_cursor cursor;
        out.encode(cursor);
        auto body = cursor.release();
        CHECK(body[0] == std::byte{'R'});
        CHECK(body[4] == std::byte{1});
        CHECK(body[5] == std::byte{2});

        structured_data_chunk in;
        decode_strt(in, body, siblings);
        CHECK(in.data_type() == "RSLT");
        CHECK(in.major_version() == 1);
        CHECK(in.minor_version() == 2);
        CHECK(in.content() == out.content());
        CHECK(in.content()["pixels"] == 1234);
    }

    SUBCASE("unset content is written as an empty object") {
        structured_data_chunk out;
        byte_cursor cursor;
        out.encode(cursor);
        auto body = cursor.release();

        std::vector<std::byte> payload(body.begin() + 6, body.end());
        CHECK(compressor().decompress(payload) == bytes_of("{}"));
    }

    SUBCASE("corrupt compressed payload") {
        structured_data_chunk c;
        CHECK_THROWS_AS(decode_strt(c, strt_body("TEST", 0, 0, bytes_of("garbage")), siblings),
                        malformed_payload);
    }

    SUBCASE("payload that is not JSON") {
        structured_data_chunk c;
        auto payload = compressor().compress(bytes_of("{not json"));
        CHECK_THROWS_AS(decode_strt(c, strt_body("TEST", 0, 0, payload), siblings), malformed_payload);
    }

    SUBCASE("too short") {
        structured_data_chunk c;
        CHECK_THROWS_AS(decode_strt(c, bytes_of("TES"), siblings), malformed_length);
    }

    SUBCASE("only one per datastream") {
        siblings.emplace<structured_data_chunk>();
        structured_data_chunk c;
        auto payload = compressor().compress(bytes_of("{}"));
        CHECK_THROWS_AS(decode_strt(c, strt_body("TEST", 0, 0, payload), siblings), duplicate_chunk);
    }

    SUBCASE("needs no header") {
        structured_data_chunk c;
        auto payload = compressor().compress(bytes_of("[1,2,3]"));
        decode_strt(c, strt_body("LIST", 3, 4, payload), siblings);
        CHECK(c.content().is_array());
        CHECK(c.content().size() == 3);
    }
}

TEST_CASE("stRT version bytes are masked on encode") {
    structured_data_chunk c;
    c.set_major_version(200);
    c.set_minor_version(17);

    byte_cursor cursor;
    c.encode(cursor);
    CHECK(cursor.data()[4] == std::byte{200});
    CHECK(cursor.data()[5] == std::byte{17});
}
