#include <doctest/doctest.h>
#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include <sstream>
#include <string>
#include "test_utils.hh"

using namespace pngme;

namespace {
    chunk make_chunk(std::string_view type, std::string_view data) {
        return chunk(chunk_type::from_string(type), to_bytes(data));
    }

    std::vector<chunk> testing_chunks() {
        return {
            make_chunk("FrSt", "I am the first chunk"),
            make_chunk("miDl", "I am another chunk"),
            make_chunk("LASt", "I am the last chunk"),
        };
    }

    png testing_png() {
        return png(testing_chunks());
    }

    std::vector<std::byte> encoded_file(const std::vector<chunk>& chunks) {
        auto out = signature_bytes();
        for (const auto& c : chunks) {
            c.encode_to(out);
        }
        return out;
    }
}

TEST_SUITE("PNG") {
    TEST_CASE("png construction") {
        SUBCASE("from chunks") {
            auto p = testing_png();
            CHECK(p.chunks().size() == 3);
        }

        SUBCASE("default is empty") {
            png p;
            CHECK(p.chunks().empty());
            CHECK(p.encode() == signature_bytes());
        }

        SUBCASE("signature") {
            std::vector<std::byte> expected = {
                std::byte{137}, std::byte{80}, std::byte{78}, std::byte{71},
                std::byte{13}, std::byte{10}, std::byte{26}, std::byte{10}
            };
            CHECK(signature_bytes() == expected);
        }
    }

    TEST_CASE("png parsing") {
        SUBCASE("valid file") {
            auto p = png::parse(encoded_file(testing_chunks()));
            REQUIRE(p.chunks().size() == 3);
            CHECK(p.chunks() == testing_chunks());
        }

        SUBCASE("signature only") {
            auto p = png::parse(signature_bytes());
            CHECK(p.chunks().empty());
        }

        SUBCASE("bad signature") {
            auto bytes = encoded_file(testing_chunks());
            bytes[0] = std::byte{13};
            CHECK_THROWS_AS((void)png::parse(bytes), bad_signature_error);
        }

        SUBCASE("bad signature is reported before any chunk is decoded") {
            // Signature and first chunk are both broken, the signature wins
            auto bytes = encoded_file(testing_chunks());
            bytes[1] = std::byte{'X'};
            bytes.back() = ~bytes.back();
            try {
                (void)png::parse(bytes);
                FAIL("Should have thrown");
            } catch (const bad_signature_error& e) {
                CHECK(e.received().size() == 8);
                CHECK(e.received()[1] == 'X');
                CHECK_FALSE(e.chunk_index().has_value());
            }
        }

        SUBCASE("input shorter than the signature") {
            auto sig = signature_bytes();
            std::vector<std::byte> bytes(sig.begin(), sig.begin() + 4);
            try {
                (void)png::parse(bytes);
                FAIL("Should have thrown");
            } catch (const bad_signature_error& e) {
                CHECK(e.received().size() == 4);
            }
            CHECK_THROWS_AS((void)png::parse(std::vector<std::byte>{}), bad_signature_error);
        }

        SUBCASE("corrupted chunk") {
            auto chunks = testing_chunks();
            auto bytes = signature_bytes();
            chunks[0].encode_to(bytes);
            auto bad = make_record(18, "miDl", "I am another chunk", 0xDEADBEEF);
            bytes.insert(bytes.end(), bad.begin(), bad.end());
            chunks[2].encode_to(bytes);

            try {
                (void)png::parse(bytes);
                FAIL("Should have thrown");
            } catch (const bad_checksum_error& e) {
                CHECK(e.received() == 0xDEADBEEF);
                REQUIRE(e.chunk_index().has_value());
                CHECK(*e.chunk_index() == 1);
                CHECK(*e.offset() == 8 + chunks[0].encoded_size());
            }
        }

        SUBCASE("invalid chunk type keeps its error type") {
            auto bytes = signature_bytes();
            auto bad = make_record(0, "Rust", "", 0);
            bytes.insert(bytes.end(), bad.begin(), bad.end());
            try {
                (void)png::parse(bytes);
                FAIL("Should have thrown");
            } catch (const invalid_identifier_error& e) {
                CHECK(*e.chunk_index() == 0);
                CHECK(*e.offset() == 8);
            }
        }

        SUBCASE("trailing bytes too short for a chunk") {
            auto bytes = encoded_file(testing_chunks());
            bytes.push_back(std::byte{0});
            bytes.push_back(std::byte{0});
            try {
                (void)png::parse(bytes);
                FAIL("Should have thrown");
            } catch (const truncated_error& e) {
                CHECK(e.available() == 2);
                CHECK(e.needed() == 12);
                CHECK(*e.chunk_index() == 3);
            }
        }

        SUBCASE("chunk data running past the end of the file") {
            auto bytes = encoded_file(testing_chunks());
            bytes.resize(bytes.size() - 5);
            CHECK_THROWS_AS((void)png::parse(bytes), truncated_error);
        }

        SUBCASE("chunk larger than the configured limit") {
            auto bytes = encoded_file(testing_chunks());
            parse_options opts;
            opts.max_chunk_size = 10;
            CHECK_THROWS_AS((void)png::parse(bytes, opts), parse_error);

            opts.strict = false;
            auto p = png::parse(bytes, opts);
            CHECK(p.chunks().size() == 3);
        }
    }

    TEST_CASE("png chunk lookup") {
        png p;
        p.append_chunk(make_chunk("IHDR", "header"));
        p.append_chunk(make_chunk("ruSt", "first message"));
        p.append_chunk(make_chunk("ruSt", "second message"));
        p.append_chunk(make_chunk("IEND", ""));

        SUBCASE("found") {
            const auto& c = p.chunk_by_type("ruSt");
            CHECK(c.type().to_string() == "ruSt");
            CHECK(c.data_as_string() == "first message");
        }

        SUBCASE("not found") {
            CHECK_THROWS_AS((void)p.chunk_by_type("zzZz"), not_found_error);
            try {
                (void)p.chunk_by_type("zzZz");
            } catch (const not_found_error& e) {
                CHECK(e.type_name() == "zzZz");
            }
        }

        SUBCASE("lookup is case sensitive") {
            CHECK_THROWS_AS((void)p.chunk_by_type("RUST"), not_found_error);
        }

        SUBCASE("text that cannot be a chunk type matches nothing") {
            CHECK_THROWS_AS((void)p.chunk_by_type("ruS"), not_found_error);
            CHECK_THROWS_AS((void)p.chunk_by_type("ruStt"), not_found_error);
        }
    }

    TEST_CASE("png append and remove") {
        SUBCASE("append goes to the end") {
            auto p = testing_png();
            p.append_chunk(make_chunk("TeSt", "Message"));
            REQUIRE(p.chunks().size() == 4);
            CHECK(p.chunks().back().type().to_string() == "TeSt");
            CHECK(p.chunk_by_type("TeSt").data_as_string() == "Message");
        }

        SUBCASE("remove keeps the order of the rest") {
            auto p = testing_png();
            auto original = testing_chunks();

            auto removed = p.remove_first_chunk("miDl");
            CHECK(removed == original[1]);
            REQUIRE(p.chunks().size() == 2);
            CHECK(p.chunks()[0] == original[0]);
            CHECK(p.chunks()[1] == original[2]);
        }

        SUBCASE("remove takes the first match only") {
            png p;
            p.append_chunk(make_chunk("ruSt", "one"));
            p.append_chunk(make_chunk("IDAT", "pixels"));
            p.append_chunk(make_chunk("ruSt", "two"));

            CHECK(p.remove_first_chunk("ruSt").data_as_string() == "one");
            REQUIRE(p.chunks().size() == 2);
            CHECK(p.chunks()[0].type().to_string() == "IDAT");
            CHECK(p.chunk_by_type("ruSt").data_as_string() == "two");
        }

        SUBCASE("remove missing") {
            auto p = testing_png();
            CHECK_THROWS_AS((void)p.remove_first_chunk("zzZz"), not_found_error);
            CHECK(p.chunks().size() == 3);
        }
    }

    TEST_CASE("png encoding") {
        SUBCASE("layout") {
            auto p = testing_png();
            CHECK(p.encode() == encoded_file(testing_chunks()));
        }

        SUBCASE("round trip") {
            png p;
            for (int i = 0; i < 20; i++) {
                p.append_chunk(make_chunk(i % 2 ? "ruSt" : "teXt", "message " + std::to_string(i)));
            }
            auto reparsed = png::parse(p.encode());
            CHECK(reparsed.chunks() == p.chunks());
            CHECK(reparsed.encode() == p.encode());
        }

        SUBCASE("round trip after mutation") {
            auto p = testing_png();
            p.append_chunk(make_chunk("TeSt", "Message"));
            (void)p.remove_first_chunk("FrSt");
            auto reparsed = png::parse(p.encode());
            REQUIRE(reparsed.chunks().size() == 3);
            CHECK(reparsed.chunks()[0].type().to_string() == "miDl");
            CHECK(reparsed.chunks()[2].type().to_string() == "TeSt");
        }
    }

    TEST_CASE("png display") {
        auto p = testing_png();
        std::ostringstream oss;
        oss << p;
        auto text = oss.str();
        CHECK(text.find("3 chunks") != std::string::npos);
        CHECK(text.find("'FrSt'") < text.find("'miDl'"));
        CHECK(text.find("'miDl'") < text.find("'LASt'"));
    }
}
