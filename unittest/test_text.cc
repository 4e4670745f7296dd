#include <doctest/doctest.h>
#include <pngc/chunks/text.hh>
#include <pngc/chunks/header.hh>
#include <pngc/chunk_list.hh>
#include <pngc/byte_cursor.hh>
#include <pngc/compressor.hh>
#include "test_utils.hh"

using namespace pngc;

namespace {
    chunk_list with_header() {
        chunk_list chunks;
        chunks.emplace<header_chunk>();
        return chunks;
    }

    template<typename T>
    void decode_into(T& c, const std::vector<std::byte>& body, const chunk_list& siblings,
                     const parse_options& opts = {}) {
        decode_context ctx(siblings, opts);
        byte_cursor cursor(body);
        c.decode(cursor, body.size(), ctx);
    }

    template<typename T>
    std::vector<std::byte> encode_body(const T& c) {
        byte_cursor cursor;
        c.encode(cursor);
        return cursor.release();
    }
}

TEST_CASE("tEXt") {
    auto siblings = with_header();

    SUBCASE("decode") {
        text_chunk c;
        decode_into(c, bytes_of({'T', 'i', 't', 'l', 'e', 0, 'H', 'e', 'l', 'l', 'o', 0xE9}), siblings);
        CHECK(c.keyword() == "Title");
        CHECK(c.text() == "Hello\xE9");
    }

    SUBCASE("empty text") {
        text_chunk c;
        decode_into(c, bytes_of({'K', 0}), siblings);
        CHECK(c.keyword() == "K");
        CHECK(c.text().empty());
    }

    SUBCASE("encode") {
        text_chunk c("Author", "Jane");
        CHECK(encode_body(c) == bytes_of({'A', 'u', 't', 'h', 'o', 'r', 0, 'J', 'a', 'n', 'e'}));
    }

    SUBCASE("keyword length") {
        CHECK_THROWS_AS(text_chunk("", "x"), invalid_field);
        CHECK_THROWS_AS(text_chunk(std::string(80, 'k'), "x"), invalid_field);
        CHECK_NOTHROW(text_chunk(std::string(79, 'k'), "x"));

        text_chunk c;
        CHECK_THROWS_AS(decode_into(c, bytes_of({0, 'x'}), siblings), invalid_field);

        warning_tracker tracker;
        auto opts = lenient();
        opts.on_warning = std::ref(tracker);
        decode_into(c, bytes_of({0, 'x'}), siblings, opts);
        CHECK(tracker.has_warning("field"));
        CHECK(c.text() == "x");
    }

    SUBCASE("requires header") {
        chunk_list empty;
        text_chunk c;
        CHECK_THROWS_AS(decode_into(c, bytes_of({'K', 0}), empty), missing_dependency);
    }

    SUBCASE("may repeat") {
        siblings.emplace<text_chunk>("A", "1");
        text_chunk c;
        CHECK_NOTHROW(decode_into(c, bytes_of({'B', 0, '2'}), siblings));
    }
}

TEST_CASE("zTXt") {
    auto siblings = with_header();

    SUBCASE("round trip") {
        compressed_text_chunk out("Description", "A long description that compresses well well well well");
        CHECK(out.type() == "zTXt"_4cc);
        auto body = encode_body(out);

        compressed_text_chunk in;
        decode_into(in, body, siblings);
        CHECK(in.keyword() == "Description");
        CHECK(in.text() == out.text());
    }

    SUBCASE("corrupt stream") {
        auto body = bytes_of({'K', 0, 0, 'x', 'y', 'z'});
        compressed_text_chunk c;
        CHECK_THROWS_AS(decode_into(c, body, siblings), malformed_payload);
    }

    SUBCASE("unknown compression method") {
        auto body = bytes_of({'K', 0, 1});
        append(body, compressor().compress(bytes_of("text")));
        compressed_text_chunk c;
        CHECK_THROWS_AS(decode_into(c, body, siblings), invalid_field);
    }

    SUBCASE("missing method byte") {
        compressed_text_chunk c;
        CHECK_THROWS_AS(decode_into(c, bytes_of({'K', 0}), siblings), malformed_length);
    }
}

TEST_CASE("iTXt") {
    auto siblings = with_header();

    SUBCASE("uncompressed round trip") {
        international_text_chunk out;
        out.set_keyword("Title");
        out.set_language_tag("de");
        out.set_translated_keyword("Titel");
        out.set_text("Gr\xC3\xBC\xC3\x9F" "e");

        auto body = encode_body(out);
        international_text_chunk in;
        decode_into(in, body, siblings);
        CHECK_FALSE(in.compressed());
        CHECK(in.keyword() == "Title");
        CHECK(in.language_tag() == "de");
        CHECK(in.translated_keyword() == "Titel");
        CHECK(in.text() == out.text());
    }

    SUBCASE("compressed round trip") {
        international_text_chunk out;
        out.set_keyword("Comment");
        out.set_compressed(true);
        out.set_text("repeated repeated repeated repeated");

        auto body = encode_body(out);
        international_text_chunk in;
        decode_into(in, body, siblings);
        CHECK(in.compressed());
        CHECK(in.language_tag().empty());
        CHECK(in.translated_keyword().empty());
        CHECK(in.text() == out.text());
    }

    SUBCASE("layout") {
        international_text_chunk c;
        c.set_keyword("K");
        c.set_language_tag("en");
        c.set_text("t");
        CHECK(encode_body(c) == bytes_of({'K', 0, 0, 0, 'e', 'n', 0, 0, 't'}));
    }

    SUBCASE("invalid compression flag") {
        international_text_chunk c;
        CHECK_THROWS_AS(decode_into(c, bytes_of({'K', 0, 2, 0, 0, 0}), siblings), invalid_field);
    }

    SUBCASE("missing separators") {
        international_text_chunk c;
        CHECK_THROWS_AS(decode_into(c, bytes_of({'K', 0, 0, 0, 'e', 'n'}), siblings), io_error);
        CHECK_THROWS_AS(decode_into(c, bytes_of({'K', 0, 0, 0}), siblings), malformed_length);
    }
}

TEST_CASE("tIME") {
    auto siblings = with_header();
    auto body = bytes_of({0x07, 0xE9, 8, 19, 13, 45, 59});

    SUBCASE("decode and encode") {
        time_chunk c;
        decode_into(c, body, siblings);
        CHECK(c.year == 2025);
        CHECK(c.month == 8);
        CHECK(c.day == 19);
        CHECK(c.hour == 13);
        CHECK(c.minute == 45);
        CHECK(c.second == 59);
        CHECK(c.is_valid());
        CHECK(encode_body(c) == body);
    }

    SUBCASE("fixed length") {
        time_chunk c;
        body.pop_back();
        CHECK_THROWS_AS(decode_into(c, body, siblings, lenient()), malformed_length);
    }

    SUBCASE("out of range fields") {
        auto bad = bytes_of({0x07, 0xE9, 13, 1, 0, 0, 0});
        time_chunk c;
        CHECK_THROWS_AS(decode_into(c, bad, siblings), invalid_field);

        warning_tracker tracker;
        auto opts = lenient();
        opts.on_warning = std::ref(tracker);
        decode_into(c, bad, siblings, opts);
        CHECK(tracker.has_warning("field"));
        CHECK_FALSE(c.is_valid());
    }

    SUBCASE("only one") {
        siblings.emplace<time_chunk>();
        time_chunk c;
        CHECK_THROWS_AS(decode_into(c, body, siblings), duplicate_chunk);
    }
}
