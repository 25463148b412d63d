#include <doctest/doctest.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

#include <array>
#include <iterator>
#include <set>
#include <sstream>
#include <unordered_map>

using namespace pngchunk;

namespace {
    chunk_type::bytes_type raw(char c0, char c1, char c2, char c3) {
        return { std::byte(c0), std::byte(c1), std::byte(c2), std::byte(c3) };
    }
}

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from bytes") {
            auto expected = raw(82, 117, 83, 116);
            auto actual = chunk_type::from_bytes(raw(82, 117, 83, 116));
            CHECK(actual.bytes() == expected);
        }

        SUBCASE("from string") {
            auto expected = chunk_type::from_bytes(raw(82, 117, 83, 116));
            auto actual = chunk_type::from_string("RuSt");
            CHECK(actual == expected);
        }

        SUBCASE("unchecked construction keeps any bytes") {
            chunk_type binary(std::byte(0x01), std::byte(0xFF), std::byte('a'), std::byte(' '));
            CHECK(binary.bytes() == raw('\x01', '\xFF', 'a', ' '));
            CHECK_FALSE(binary.is_valid());

            chunk_type lower('R', 'u', 's', 't');
            CHECK(lower.to_string() == "Rust");
            CHECK_FALSE(lower.is_valid());
        }

        SUBCASE("to_string") {
            CHECK(chunk_type::from_string("RuSt").to_string() == "RuSt");
            CHECK(chunk_types::IHDR.to_string() == "IHDR");
            CHECK(chunk_types::tEXt.to_string() == "tEXt");
        }
    }

    TEST_CASE("chunk_type properties") {
        SUBCASE("critical") {
            CHECK(chunk_type::from_string("RuSt").is_critical());
            CHECK_FALSE(chunk_type::from_string("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_string("RUSt").is_public());
            CHECK_FALSE(chunk_type::from_string("RuSt").is_public());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::from_string("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type('R', 'u', 's', 't').is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::from_string("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::from_string("RuST").is_safe_to_copy());
        }

        SUBCASE("standard types") {
            CHECK(chunk_types::IHDR.is_valid());
            CHECK(chunk_types::IHDR.is_critical());
            CHECK(chunk_types::IHDR.is_public());
            CHECK_FALSE(chunk_types::IHDR.is_safe_to_copy());

            CHECK(chunk_types::tEXt.is_valid());
            CHECK_FALSE(chunk_types::tEXt.is_critical());
            CHECK(chunk_types::tEXt.is_safe_to_copy());
        }

        SUBCASE("predicates work on invalid tags") {
            chunk_type bad('R', '1', 's', '?');
            CHECK_FALSE(bad.is_valid());
            CHECK(bad.is_critical());
            CHECK_FALSE(bad.is_public());
            CHECK_FALSE(bad.is_reserved_bit_valid());
            CHECK_FALSE(bad.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk_type validity") {
        SUBCASE("valid tag") {
            CHECK(chunk_type::from_string("RuSt").is_valid());
        }

        SUBCASE("lowercase reserved bit") {
            CHECK_FALSE(chunk_type('R', 'u', 's', 't').is_valid());
            CHECK_THROWS_AS(chunk_type::from_string("Rust"), invalid_tag_error);
            CHECK_THROWS_AS(chunk_type::from_bytes(raw('R', 'u', 's', 't')), invalid_tag_error);
        }

        SUBCASE("non-letter bytes") {
            CHECK_THROWS_AS(chunk_type::from_string("Ru1t"), invalid_tag_error);
            CHECK_THROWS_AS(chunk_type::from_string("Ru t"), invalid_tag_error);
            CHECK_THROWS_AS(chunk_type::from_bytes(raw('R', 'u', 'S', '\0')), invalid_tag_error);
            CHECK_THROWS_AS(chunk_type::from_bytes(raw('R', '\xC3', 'S', 't')), invalid_tag_error);
            // Letters are only ASCII letters: '@' and '[' bracket 'A'..'Z'
            CHECK_THROWS_AS(chunk_type::from_string("@uSt"), invalid_tag_error);
            CHECK_THROWS_AS(chunk_type::from_string("RuS["), invalid_tag_error);
            CHECK_THROWS_AS(chunk_type::from_string("`uSt"), invalid_tag_error);
            CHECK_THROWS_AS(chunk_type::from_string("RuS{"), invalid_tag_error);
        }

        SUBCASE("wrong length") {
            CHECK_THROWS_AS(chunk_type::from_string(""), invalid_tag_error);
            CHECK_THROWS_AS(chunk_type::from_string("RuS"), invalid_tag_error);
            CHECK_THROWS_AS(chunk_type::from_string("RuStt"), invalid_tag_error);
            // 4 bytes but not 4 ASCII characters
            CHECK_THROWS_AS(chunk_type::from_string("R\xC3\xBCS"), invalid_tag_error);
        }

        SUBCASE("error kind") {
            try {
                (void)chunk_type::from_string("Rust");
                FAIL("Should have thrown exception");
            } catch (const pngchunk_error& e) {
                CHECK(e.kind() == error_kind::invalid_tag);
            }
        }

        SUBCASE("from_bytes succeeds exactly for valid tags") {
            const std::array<char, 10> alphabet = {'a', 'z', 'A', 'Z', '@', '[', '`', '{', '0', '\x80'};
            int accepted = 0;
            for (char c0 : alphabet) {
                for (char c1 : alphabet) {
                    for (char c2 : alphabet) {
                        for (char c3 : alphabet) {
                            auto bytes = raw(c0, c1, c2, c3);
                            bool valid = chunk_type(bytes).is_valid();
                            bool parsed = true;
                            try {
                                auto t = chunk_type::from_bytes(bytes);
                                CHECK(t.is_valid());
                                CHECK(t.bytes() == bytes);
                            } catch (const invalid_tag_error&) {
                                parsed = false;
                            }
                            CHECK(parsed == valid);
                            if (parsed) {
                                accepted++;
                            }
                        }
                    }
                }
            }
            // 4 letters for bytes 0, 1, 3 and 2 uppercase letters for byte 2
            CHECK(accepted == 4 * 4 * 2 * 4);
        }

        SUBCASE("lowercase third byte always rejected") {
            for (char c = 'a'; c <= 'z'; c++) {
                std::string text = {'X', 'y', c, 'Z'};
                CHECK_THROWS_AS(chunk_type::from_string(text), invalid_tag_error);
                CHECK_FALSE(chunk_type(text[0], text[1], text[2], text[3]).is_valid());
            }
        }
    }

    TEST_CASE("chunk_type comparison and hashing") {
        SUBCASE("equality") {
            CHECK(chunk_type::from_string("IDAT") == chunk_types::IDAT);
            CHECK(chunk_type::from_string("IDAT") != chunk_types::IEND);
            CHECK(chunk_type('a', 'b', 'C', 'd') != chunk_type('A', 'b', 'C', 'd'));
        }

        SUBCASE("use in sorted containers") {
            std::set<chunk_type> types;
            types.insert(chunk_types::tEXt);
            types.insert(chunk_types::IHDR);
            types.insert(chunk_types::IEND);
            types.insert(chunk_types::IHDR);

            CHECK(types.size() == 3);
            CHECK(*types.begin() == chunk_types::IEND);
            CHECK(*std::prev(types.end()) == chunk_types::tEXt);
        }

        SUBCASE("use in unordered containers") {
            std::unordered_map<chunk_type, int> counts;
            counts[chunk_types::IDAT] += 1;
            counts[chunk_types::IDAT] += 1;
            counts[chunk_types::IEND] += 1;

            CHECK(counts.size() == 2);
            CHECK(counts[chunk_type::from_string("IDAT")] == 2);
            CHECK(chunk_type_hash{}(chunk_types::IDAT) == std::hash<chunk_type>{}(chunk_types::IDAT));
        }
    }

    TEST_CASE("chunk_type stream output") {
        SUBCASE("printable tag") {
            std::stringstream ss;
            ss << chunk_type::from_string("RuSt");
            CHECK(ss.str() == "'RuSt'");
        }

        SUBCASE("non-printable bytes") {
            std::stringstream ss;
            ss << chunk_type('A', 'B', '\x01', '\n');
            CHECK(ss.str() == "'AB\\x01\\x0a'");
        }

        SUBCASE("preserving stream state") {
            std::stringstream ss;
            ss << std::uppercase;
            auto flags = ss.flags();
            ss << chunk_type('\x7F', 'B', 'C', 'D');
            CHECK(ss.flags() == flags);
            ss << 255;
            CHECK(ss.str() == "'\\x7FBCD'255");
        }
    }
}
