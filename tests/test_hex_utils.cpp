#include <catch2/catch_all.hpp>

#include "obdstream/src/hex_utils.hpp"
#include <string>
#include <vector>

using namespace obd;

TEST_CASE("is_hex: accepts uppercase hex") {
    CHECK(is_hex("410C1B56"));
    CHECK(is_hex("0123456789ABCDEF"));
    CHECK(is_hex("5"));
}

TEST_CASE("is_hex: rejects everything else") {
    CHECK_FALSE(is_hex(""));
    CHECK_FALSE(is_hex("410c1b56"));   // lowercase
    CHECK_FALSE(is_hex("NODATA"));
    CHECK_FALSE(is_hex("41 0C"));
    CHECK_FALSE(is_hex("41-0C"));
    CHECK_FALSE(is_hex("SEARCHING..."));
    CHECK_FALSE(is_hex("410G"));
}

TEST_CASE("group_bytes: pairs") {
    CHECK(group_bytes("1B56") == std::vector<std::string>{"1B", "56"});
    CHECK(group_bytes("410C1B56") == std::vector<std::string>{"41", "0C", "1B", "56"});
}

TEST_CASE("group_bytes: odd length keeps a short last group") {
    CHECK(group_bytes("1B5") == std::vector<std::string>{"1B", "5"});
    CHECK(group_bytes("A") == std::vector<std::string>{"A"});
}

TEST_CASE("group_bytes: spaces dropped, generic text grouped too") {
    CHECK(group_bytes("41 0C 1B 56") == std::vector<std::string>{"41", "0C", "1B", "56"});
    CHECK(group_bytes("NODATA") == std::vector<std::string>{"NO", "DA", "TA"});
    CHECK(group_bytes("").empty());
}

TEST_CASE("parse_byte") {
    uint8_t b = 0;
    REQUIRE(parse_byte("1B", b));
    CHECK(b == 0x1B);
    REQUIRE(parse_byte("5", b));
    CHECK(b == 0x05);
    REQUIRE(parse_byte("ff", b));
    CHECK(b == 0xFF);
    CHECK_FALSE(parse_byte("", b));
    CHECK_FALSE(parse_byte("1B5", b));
    CHECK_FALSE(parse_byte("XY", b));
}

TEST_CASE("byte_to_hex") {
    CHECK(byte_to_hex(0x0C) == "0C");
    CHECK(byte_to_hex(0xA6) == "A6");
    CHECK(byte_to_hex(0x00) == "00");
}
