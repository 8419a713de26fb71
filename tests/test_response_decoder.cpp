#include <catch2/catch_all.hpp>

#include "obdstream/src/response_decoder.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace obd;
using Catch::Approx;
using Groups = std::vector<std::string>;

static const PidRegistry& registry() {
    static PidRegistry reg = [] {
        PidRegistry r;
        load_default_registry(r);
        return r;
    }();
    return reg;
}

TEST_CASE("decode_command: rpm") {
    ParseResult r = decode_command("410C1B56", registry(), 12.5);
    CHECK(r.timestamp == 12.5);
    CHECK(r.raw == "410C1B56");
    CHECK(r.byte_groups == Groups{"41", "0C", "1B", "56"});
    CHECK(r.name == "Rpm");
    CHECK(r.unit == "rpm");
    CHECK_FALSE(r.error);
    REQUIRE(r.value);
    CHECK(std::get<double>(*r.value) == Approx(1749.5));
}

TEST_CASE("decode_command: generic message has neither value nor error") {
    ParseResult r = decode_command("NODATA", registry(), 1.0);
    CHECK(r.raw == "NODATA");
    CHECK(r.byte_groups == Groups{"NO", "DA", "TA"});
    CHECK_FALSE(r.value);
    CHECK_FALSE(r.error);
    CHECK(r.is_generic());

    CHECK(decode_command("410c1b56", registry(), 1.0).is_generic());
}

TEST_CASE("decode_command: unsupported mode") {
    ParseResult r = decode_command("5512AB", registry(), 1.0);
    CHECK_FALSE(r.value);
    REQUIRE(r.error);
    CHECK(r.error->kind == ErrorKind::UnsupportedMode);
    CHECK(r.error->byte_groups == Groups{"55", "12", "AB"});
    CHECK(r.error->message == "Unable to parse bytes for output \"55 12 AB\"; mode \"55\" not supported");
    CHECK(r.byte_groups == Groups{"55", "12", "AB"});
}

TEST_CASE("decode_command: no converter") {
    ParseResult r = decode_command("41FF00", registry(), 1.0);
    REQUIRE(r.error);
    CHECK(r.error->kind == ErrorKind::NoConverter);
    CHECK(r.error->pid == "FF");
    CHECK(r.error->message == "no converter was found for pid FF");
    CHECK(r.name.empty());

    ParseResult bare = decode_command("41", registry(), 1.0);
    REQUIRE(bare.error);
    CHECK(bare.error->kind == ErrorKind::NoConverter);
    CHECK(bare.error->pid.empty());
}

TEST_CASE("decode_command: conversion failure carries the cause") {
    ParseResult r = decode_command("410C1B", registry(), 1.0);
    CHECK_FALSE(r.value);
    REQUIRE(r.error);
    CHECK(r.error->kind == ErrorKind::ConversionFailed);
    CHECK(r.error->pid == "0C");
    CHECK(r.error->cause == "PID 0C expects 2 data bytes, got 1");
    CHECK(r.byte_groups == Groups{"41", "0C", "1B"});
}

TEST_CASE("decode_command: slice bounded by the descriptor byte count") {
    // trailing bytes past the coolant byte are ignored
    ParseResult r = decode_command("41057EFFFF", registry(), 1.0);
    REQUIRE(r.value);
    CHECK(std::get<double>(*r.value) == Approx(86.0));
    CHECK(r.byte_groups.size() == 5);
}

TEST_CASE("decode_command: odd length line") {
    ParseResult r = decode_command("410C1B5", registry(), 1.0);
    CHECK(r.byte_groups == Groups{"41", "0C", "1B", "5"});
    REQUIRE(r.value);
    CHECK(std::get<double>(*r.value) == Approx(1729.25));
}

TEST_CASE("decode_command: supported pids and value tables") {
    ParseResult sup = decode_command("4100BE1FA813", registry(), 1.0);
    REQUIRE(sup.value);
    CHECK(std::get<std::vector<std::string>>(*sup.value).size() == 17);

    ParseResult std_r = decode_command("411C01", registry(), 1.0);
    REQUIRE(std_r.value);
    CHECK(std::get<std::string>(*std_r.value) == "OBD-II as defined by the CARB");
}

TEST_CASE("decode_command: debug trace") {
    std::ostringstream log;
    decode_command("NODATA", registry(), 1.0, &log);
    decode_command("410D3C", registry(), 1.0, &log);
    CHECK(log.str() == "[parser] generic output \"NODATA\", not parsing\n"
                       "[parser] 410D3C -> 60\n");
}

TEST_CASE("write_result: line format") {
    std::ostringstream os;
    write_result(decode_command("410C1B56", registry(), 2.5), os);
    write_result(decode_command("NODATA", registry(), 2.5), os);
    write_result(decode_command("41FF00", registry(), 2.5), os);
    CHECK(os.str() == "(2.500): 410C1B56: Rpm: 1749.5 rpm\n"
                      "(2.500): NODATA\n"
                      "(2.500): 41FF00: error: no converter was found for pid FF\n");
}

TEST_CASE("to_string: error kinds") {
    CHECK(std::string(to_string(ErrorKind::UnsupportedMode)) == "UnsupportedMode");
    CHECK(std::string(to_string(ErrorKind::NoConverter)) == "NoConverter");
    CHECK(std::string(to_string(ErrorKind::ConversionFailed)) == "ConversionFailed");
}
