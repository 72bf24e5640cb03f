//
// Tests against real PNG files in unittest/data
//

#include <doctest/doctest.h>
#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include <string>
#include <vector>
#include "test_utils.hh"

using namespace pngme;

namespace {
    std::vector<std::string> type_names(const png& p) {
        std::vector<std::string> names;
        for (const auto& c : p.chunks()) {
            names.push_back(c.type().to_string());
        }
        return names;
    }
}

TEST_CASE("test data files - tiny.png") {
    auto is = load_test("tiny.png");
    REQUIRE(is->good());

    auto p = png::read(*is);
    CHECK(type_names(p) == std::vector<std::string>{"IHDR", "IDAT", "IEND"});

    SUBCASE("standard chunk properties") {
        for (const auto& c : p.chunks()) {
            CHECK(c.type().is_critical());
            CHECK(c.type().is_public());
            CHECK(c.type().is_valid());
        }
        CHECK(p.chunk_by_type("IHDR").length() == 13);
        CHECK(p.chunk_by_type("IEND").length() == 0);
        CHECK(p.chunk_by_type("IEND").crc() == 0xAE426082u);
    }

    SUBCASE("re-encoding is byte exact") {
        CHECK(p.encode() == load_test_data("tiny.png"));
    }

    SUBCASE("no message chunk") {
        CHECK_THROWS_AS((void)p.chunk_by_type("ruSt"), not_found_error);
    }

    SUBCASE("hide and recover a message") {
        p.append_chunk(chunk(chunk_type::from_string("ruSt"), to_bytes("hidden")));
        auto reparsed = png::parse(p.encode());
        CHECK(reparsed.chunks().size() == 4);
        CHECK(reparsed.chunk_by_type("ruSt").data_as_string() == "hidden");

        auto removed = reparsed.remove_first_chunk("ruSt");
        CHECK(removed.data_as_string() == "hidden");
        CHECK(reparsed.encode() == load_test_data("tiny.png"));
    }
}

TEST_CASE("test data files - with_message.png") {
    auto data = load_test_data("with_message.png");
    auto p = png::parse(data);

    CHECK(type_names(p) == std::vector<std::string>{"IHDR", "tEXt", "IDAT", "ruSt", "ruSt", "IEND"});
    CHECK(p.encode() == data);

    SUBCASE("first message wins") {
        const auto& c = p.chunk_by_type("ruSt");
        CHECK(c.data_as_string() == secret_message);
        CHECK(c.crc() == chunk(chunk_type::from_string("ruSt"), to_bytes(secret_message)).crc());
    }

    SUBCASE("ancillary chunks") {
        const auto& text = p.chunk_by_type("tEXt");
        CHECK_FALSE(text.type().is_critical());
        CHECK(text.type().is_safe_to_copy());

        const auto& msg = p.chunk_by_type("ruSt");
        CHECK_FALSE(msg.type().is_critical());
        CHECK_FALSE(msg.type().is_public());
        CHECK(msg.type().is_safe_to_copy());
    }

    SUBCASE("remove both messages") {
        CHECK(p.remove_first_chunk("ruSt").data_as_string() == secret_message);
        CHECK(p.remove_first_chunk("ruSt").data_as_string() == "second");
        CHECK_THROWS_AS((void)p.remove_first_chunk("ruSt"), not_found_error);
        CHECK(type_names(p) == std::vector<std::string>{"IHDR", "tEXt", "IDAT", "IEND"});
    }

    SUBCASE("truncated copy of the file") {
        // None of these cuts lands on a chunk boundary
        for (std::size_t cut : {1u, 4u, 11u, 13u, 29u, 31u, 60u, 100u, 140u, 160u}) {
            std::vector<std::byte> truncated(data.begin(), data.end() - static_cast<std::ptrdiff_t>(cut));
            CHECK_THROWS_AS((void)png::parse(truncated), parse_error);
        }
    }
}
